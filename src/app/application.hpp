/**
 * devhttps - Local HTTPS Development Server
 * Application - startup sequence shared by main() and the tests
 */

#ifndef DEVHTTPS_APP_APPLICATION_HPP
#define DEVHTTPS_APP_APPLICATION_HPP

#include <iosfwd>

namespace devhttps::app {

/**
 * Load configuration, make sure TLS credentials exist, then serve until
 * SIGINT or SIGTERM
 *
 * @param err Stream that receives remediation guidance when credentials
 *            cannot be created
 * @return Process exit code: 0 after a clean shutdown or --help, 1 on any
 *         startup failure
 */
int run(int argc, char* argv[], std::ostream& err);

} // namespace devhttps::app

#endif // DEVHTTPS_APP_APPLICATION_HPP
