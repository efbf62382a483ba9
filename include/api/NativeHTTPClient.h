#pragma once

#include <string>
#include <map>
#include <memory>

namespace SheetCalc {

/**
 * @brief Synchronous HTTP/HTTPS client using Boost.Beast
 *
 * One request per call, one connection per request. Transport failures
 * (DNS, connect, TLS, timeout) come back with statusCode 0 and `error` set;
 * nothing throws out of a request method.
 *
 * Methods are virtual so the remote workbook store can be exercised
 * against a scripted client in tests.
 */
class NativeHTTPClient {
public:
    struct Response {
        int statusCode = 0;
        std::string body;
        std::map<std::string, std::string> headers;
        std::string error;
        bool success = false;
    };

    NativeHTTPClient();
    virtual ~NativeHTTPClient();

    virtual Response get(const std::string& url,
                         const std::map<std::string, std::string>& headers = {});

    virtual Response put(const std::string& url,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers = {});

    // Send/receive timeout applied to each request's socket (seconds)
    void setTimeout(int seconds);
    int timeout() const { return m_timeout; }

    void setVerifyPeer(bool verify) { m_verifyPeer = verify; }

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
    int m_timeout;
    bool m_verifyPeer;

    Response makeRequest(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers);
};

} // namespace SheetCalc
