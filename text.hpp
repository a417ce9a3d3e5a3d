#ifndef TEXT_HPP
#define TEXT_HPP

#include <string>

std::string check_utf8(std::string const &text);
int integer_zoom(std::string where, std::string text);
long long integer_tile(std::string where, std::string text, int zoom);

#endif
