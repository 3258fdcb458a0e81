#include "app.hpp"
#include "log.hpp"

#include <curl/curl.h>

/**
 * Program entry point running one backup or report task.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int ret = 0;
  {
    omb::App app;
    ret = app.run(argc, argv);
  }
  omb::shutdown_logger();
  curl_global_cleanup();
  return ret;
}
