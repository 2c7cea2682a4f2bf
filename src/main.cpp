/**
 * devhttps - Local HTTPS Development Server
 *
 * Serves a directory over HTTPS with a self-signed certificate that is
 * generated on first run.
 */

#include "app/application.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    return devhttps::app::run(argc, argv, std::cerr);
}
