#ifndef METASCRUB_COLOR_HPP
#define METASCRUB_COLOR_HPP

// ANSI escape sequences for terminal output
#define RESET   "\033[0m"
#define RED     "\033[1;31m"
#define GREEN   "\033[1;32m"
#define YELLOW  "\033[1;33m"
#define CYAN    "\033[1;36m"

#endif // METASCRUB_COLOR_HPP
