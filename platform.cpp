#include "platform.hpp"
#include <unistd.h>

long get_num_avail_cpus() {
	long cpus = sysconf(_SC_NPROCESSORS_ONLN);
	if (cpus < 1) {
		cpus = 1;
	}
	return cpus;
}
