#include "utils.hpp"

#include "credentials/openssl_util.hpp"
#include "credentials/self_signed.hpp"
#include "server/ssl_connection.hpp"
#include "server/ssl_context.hpp"
#include "server/ssl_server.hpp"
#include "server/static_file_handler.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>
#include <stop_token>
#include <thread>

namespace devhttps::test
{
    namespace asio = boost::asio;
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace ssl = asio::ssl;
    using tcp = asio::ip::tcp;

    namespace
    {
        // Blocking HTTPS client that accepts any certificate
        class TestClient
        {
          public:
            // max_version of 0 leaves the protocol range to OpenSSL
            explicit TestClient(std::uint16_t port, int max_version = 0)
            {
                stream_.set_verify_mode(ssl::verify_none);
                if (max_version != 0)
                {
                    SSL_set_min_proto_version(stream_.native_handle(), 0);
                    SSL_set_max_proto_version(stream_.native_handle(), max_version);
                }
                SSL_set_tlsext_host_name(stream_.native_handle(), "localhost");
                beast::get_lowest_layer(stream_).connect(tcp::endpoint{asio::ip::make_address("127.0.0.1"), port});
                stream_.handshake(ssl::stream_base::client);
            }

            ~TestClient()
            {
                beast::error_code ec;
                stream_.shutdown(ec);
            }

            std::string protocol() { return SSL_get_version(stream_.native_handle()); }

            std::string peer_common_name()
            {
                credentials::X509Ptr cert{SSL_get_peer_certificate(stream_.native_handle())};
                if (!cert)
                    return {};
                char buf[256] = {};
                X509_NAME_get_text_by_NID(X509_get_subject_name(cert.get()), NID_commonName, buf, sizeof(buf));
                return buf;
            }

            http::response<http::string_body> request(http::verb method, const std::string& target)
            {
                http::request<http::empty_body> req{method, target, 11};
                req.set(http::field::host, "localhost");
                req.keep_alive(false);
                http::write(stream_, req);

                http::response_parser<http::string_body> parser;
                if (method == http::verb::head)
                    parser.skip(true);
                http::read(stream_, buffer_, parser);
                return parser.release();
            }

            http::response<http::string_body> raw(const std::string& bytes)
            {
                asio::write(stream_, asio::buffer(bytes));
                http::response<http::string_body> res;
                http::read(stream_, buffer_, res);
                return res;
            }

          private:
            asio::io_context ioc_;
            ssl::context ctx_{ssl::context::tls_client};
            ssl::stream<beast::tcp_stream> stream_{ioc_, ctx_};
            beast::flat_buffer buffer_;
        };

        // Several TLS records worth of data with a position-dependent pattern
        std::string large_contents()
        {
            std::string data(3 * 1024 * 1024 + 17, '\0');
            for (std::size_t i = 0; i < data.size(); ++i)
                data[i] = static_cast<char>('a' + (i * 7) % 26);
            return data;
        }

        // Bundle + document root + server bound to an ephemeral loopback port
        struct ServerFixture
        {
            TempDir dir;
            std::filesystem::path bundle = dir / "server.pem";
            std::filesystem::path root = dir / "www";
            std::unique_ptr<server::SslServer> server;

            ServerFixture()
            {
                write_file(bundle, credentials::generate_self_signed_bundle().to_pem());
                write_file(root / "index.html", "<h1>it works</h1>");
                write_file(root / "data.json", R"({"ok":true})");
                write_file(root / "large.bin", large_contents());

                server::SslServerConfig cfg;
                cfg.bind_address = "127.0.0.1";
                cfg.port = 0;
                cfg.ssl = server::make_bundle_ssl_config(bundle);
                server = std::make_unique<server::SslServer>(cfg);

                auto files = std::make_shared<server::StaticFileHandler>(server::StaticFileConfig{root});
                server::RequestHandler handler = [files](const server::HttpRequest& req) { return (*files)(req); };
                server->start([handler](tcp::socket socket, ssl::context& ssl_ctx) {
                    server::handle_ssl_connection(std::move(socket), ssl_ctx, handler);
                });
            }
        };
    }  // namespace

    TEST_CASE("SSL server: serves files over HTTPS until stopped", "[ssl_server]")
    {
        ServerFixture fx;
        auto& srv = *fx.server;

        REQUIRE(srv.is_running());
        auto port = srv.get_port();
        REQUIRE(port != 0);

        std::jthread runner{[&srv](std::stop_token st) { srv.run(st); }};

        SECTION("GET of a file")
        {
            TestClient client{port};
            CHECK(client.peer_common_name() == "localhost");

            auto res = client.request(http::verb::get, "/data.json");
            CHECK(res.result() == http::status::ok);
            CHECK(res.body() == R"({"ok":true})");
            CHECK(res[http::field::content_type] == "application/json");
            CHECK(res[http::field::server] == "devhttps/0.1.0");
        }

        SECTION("large file is streamed intact")
        {
            TestClient client{port};
            auto res = client.request(http::verb::get, "/large.bin");
            CHECK(res.result() == http::status::ok);
            CHECK(res[http::field::content_length] == std::to_string(large_contents().size()));
            CHECK(res[http::field::content_type] == "application/octet-stream");
            CHECK(res.body().size() == large_contents().size());
            CHECK(res.body() == large_contents());
        }

        SECTION("trailing slash after a file name")
        {
            TestClient client{port};
            CHECK(client.request(http::verb::get, "/data.json/").result() == http::status::not_found);
        }

        SECTION("TLS 1.2 and 1.3 are accepted, older versions are not")
        {
            TestClient tls12{port, TLS1_2_VERSION};
            CHECK(tls12.protocol() == "TLSv1.2");
            CHECK(tls12.request(http::verb::get, "/data.json").result() == http::status::ok);

            TestClient tls13{port, TLS1_3_VERSION};
            CHECK(tls13.protocol() == "TLSv1.3");

            CHECK_THROWS(TestClient{port, TLS1_1_VERSION});
        }

        SECTION("directory index")
        {
            TestClient client{port};
            auto res = client.request(http::verb::get, "/");
            CHECK(res.result() == http::status::ok);
            CHECK(res.body() == "<h1>it works</h1>");
        }

        SECTION("HEAD keeps the Content-Length of the file")
        {
            TestClient client{port};
            auto res = client.request(http::verb::head, "/index.html");
            CHECK(res.result() == http::status::ok);
            CHECK(res[http::field::content_length] == "17");
            CHECK(res.body().empty());
        }

        SECTION("not found")
        {
            TestClient client{port};
            CHECK(client.request(http::verb::get, "/missing.txt").result() == http::status::not_found);
        }

        SECTION("malformed request line")
        {
            TestClient client{port};
            auto res = client.raw("GARBAGE\r\n\r\n");
            CHECK(res.result() == http::status::bad_request);
        }

        SECTION("unsupported HTTP version")
        {
            TestClient client{port};
            auto res = client.raw("GET / HTTP/2.0\r\nHost: localhost\r\n\r\n");
            CHECK(res.result() == http::status::http_version_not_supported);
            CHECK(res.version() == 11);
            CHECK_THAT(res.body(), Catch::Contains("Only HTTP/1.0 and HTTP/1.1"));
        }

        runner.request_stop();
        runner.join();

        CHECK_FALSE(srv.is_running());
        CHECK(srv.connections_accepted() >= 1);
    }

    TEST_CASE("SSL server: stop request before run returns promptly", "[ssl_server]")
    {
        ServerFixture fx;

        std::stop_source source;
        source.request_stop();
        fx.server->run(source.get_token());

        // Destruction closes the acceptor
        fx.server.reset();
        SUCCEED();
    }

    TEST_CASE("SSL server: occupied port fails to start", "[ssl_server]")
    {
        ServerFixture fx;
        auto port = fx.server->get_port();

        server::SslServerConfig cfg;
        cfg.bind_address = "127.0.0.1";
        cfg.port = port;
        cfg.ssl = server::make_bundle_ssl_config(fx.bundle);
        server::SslServer second{cfg};

        CHECK_THROWS_AS(second.start([](tcp::socket, ssl::context&) {}), std::runtime_error);
        CHECK_FALSE(second.is_running());
    }

    TEST_CASE("SSL context: unusable bundles are rejected", "[ssl_server][ssl_context]")
    {
        TempDir dir;
        auto bundle = dir / "server.pem";

        SECTION("missing file")
        {
            CHECK_THROWS_AS(server::SslContextManager{server::make_bundle_ssl_config(bundle)}, std::runtime_error);
        }

        SECTION("garbage contents")
        {
            write_file(bundle, "this is not PEM\n");
            CHECK_THROWS_AS(server::SslContextManager{server::make_bundle_ssl_config(bundle)}, std::runtime_error);
        }

        SECTION("certificate without its key")
        {
            write_file(bundle, credentials::generate_self_signed_bundle().certificate_pem);
            CHECK_THROWS_AS(server::SslContextManager{server::make_bundle_ssl_config(bundle)}, std::runtime_error);
        }

        SECTION("key from a different certificate")
        {
            auto a = credentials::generate_self_signed_bundle();
            auto b = credentials::generate_self_signed_bundle();
            write_file(bundle, a.private_key_pem + b.certificate_pem);
            CHECK_THROWS_AS(server::SslContextManager{server::make_bundle_ssl_config(bundle)}, std::runtime_error);
        }

        SECTION("valid bundle")
        {
            write_file(bundle, credentials::generate_self_signed_bundle().to_pem());
            server::SslContextManager manager{server::make_bundle_ssl_config(bundle)};
            CHECK_THAT(manager.get_certificate_subject(), Catch::Contains("CN=localhost"));
        }
    }

}  // namespace devhttps::test
