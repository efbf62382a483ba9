#include <QtTest>
#include <QDir>
#include <QFileInfo>
#include "api/NativeHTTPClient.h"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <thread>

using namespace SheetCalc;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

QString tlsFile(const char *name)
{
    return QString(SHEETCALC_SOURCE_DIR) + "/tests/data/tls/" + name;
}

/**
 * HTTPS server on 127.0.0.1 presenting a certificate issued for "localhost"
 * only. Every request that completes a handshake gets "200 ok".
 */
class LocalTlsServer {
public:
    LocalTlsServer()
        : m_ctx(ssl::context::tlsv12_server)
        , m_acceptor(m_ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
    {
        m_ctx.use_certificate_chain_file(tlsFile("localhost.pem").toStdString());
        m_ctx.use_private_key_file(tlsFile("localhost.key").toStdString(), ssl::context::pem);
        m_thread = std::thread([this] { run(); });
    }

    ~LocalTlsServer()
    {
        m_stopping = true;
        // Unblock accept()
        beast::error_code ec;
        tcp::socket wake(m_ioc);
        wake.connect(m_acceptor.local_endpoint(), ec);
        m_thread.join();
    }

    unsigned short port() const { return m_acceptor.local_endpoint().port(); }
    int served() const { return m_served; }

private:
    void run()
    {
        while (!m_stopping) {
            tcp::socket socket(m_ioc);
            beast::error_code ec;
            m_acceptor.accept(socket, ec);
            if (ec || m_stopping)
                break;
            serve(std::move(socket));
        }
    }

    void serve(tcp::socket socket)
    {
        ssl::stream<tcp::socket> stream(std::move(socket), m_ctx);
        beast::error_code ec;
        stream.handshake(ssl::stream_base::server, ec);
        if (ec)
            return;

        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(stream, buffer, req, ec);
        if (ec)
            return;

        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::content_type, "text/plain");
        res.body() = "ok";
        res.prepare_payload();
        http::write(stream, res, ec);
        if (!ec)
            ++m_served;
        stream.shutdown(ec);
    }

    net::io_context m_ioc;
    ssl::context m_ctx;
    tcp::acceptor m_acceptor;
    std::thread m_thread;
    std::atomic<bool> m_stopping{false};
    std::atomic<int> m_served{0};
};

} // namespace

class TestNativeHTTPClient : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void testInvalidUrl();
    void testTrustedCertificateForRequestedHost();
    void testCertificateForAnotherHostRejected();
    void testVerificationDisabledSkipsHostCheck();
};

void TestNativeHTTPClient::initTestCase()
{
    // Default verify paths honour SSL_CERT_FILE; trust only the test CA
    QVERIFY(QFileInfo(tlsFile("ca.pem")).isFile());
    qputenv("SSL_CERT_FILE", tlsFile("ca.pem").toLocal8Bit());
    qputenv("SSL_CERT_DIR", QDir(tlsFile("")).absolutePath().toLocal8Bit());
}

void TestNativeHTTPClient::testInvalidUrl()
{
    NativeHTTPClient client;
    auto response = client.get("ftp://example.test/file");
    QVERIFY(!response.success);
    QCOMPARE(response.statusCode, 0);
    QCOMPARE(QString::fromStdString(response.error), QString("Invalid URL format"));
}

void TestNativeHTTPClient::testTrustedCertificateForRequestedHost()
{
    LocalTlsServer server;
    NativeHTTPClient client;
    client.setTimeout(5);

    auto response = client.get("https://localhost:" + std::to_string(server.port()) + "/ping");
    QVERIFY2(response.success, response.error.c_str());
    QCOMPARE(response.statusCode, 200);
    QCOMPARE(QString::fromStdString(response.body), QString("ok"));
}

void TestNativeHTTPClient::testCertificateForAnotherHostRejected()
{
    LocalTlsServer server;
    NativeHTTPClient client;
    client.setTimeout(5);

    // Same server and a chain the client trusts, but the certificate does not name 127.0.0.1
    auto response = client.get("https://127.0.0.1:" + std::to_string(server.port()) + "/ping");
    QVERIFY(!response.success);
    QCOMPARE(response.statusCode, 0);
    QVERIFY(!response.error.empty());
    QCOMPARE(server.served(), 0);
}

void TestNativeHTTPClient::testVerificationDisabledSkipsHostCheck()
{
    LocalTlsServer server;
    NativeHTTPClient client;
    client.setTimeout(5);
    client.setVerifyPeer(false);

    auto response = client.get("https://127.0.0.1:" + std::to_string(server.port()) + "/ping");
    QVERIFY2(response.success, response.error.c_str());
    QCOMPARE(response.statusCode, 200);
}

QTEST_APPLESS_MAIN(TestNativeHTTPClient)
#include "test_native_http_client.moc"
