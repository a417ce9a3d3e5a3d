#ifndef PLATFORM_HPP
#define PLATFORM_HPP

long get_num_avail_cpus();

#endif	// PLATFORM_HPP
