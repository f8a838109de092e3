#include "terminal.hpp"
#include <sys/ioctl.h>
#include <unistd.h>

size_t get_terminal_width() {
#ifdef TIOCGWINSZ
  struct winsize ts;
  if (ioctl(STDIN_FILENO, TIOCGWINSZ, &ts) == 0)
    return ts.ws_col;
#endif /* TIOCGWINSZ */
  return 0;
}
