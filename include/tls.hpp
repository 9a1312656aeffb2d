#ifndef QMANAGER_TLS_HPP
#define QMANAGER_TLS_HPP

#include "socket.hpp"
#include "stream.hpp"

#include <openssl/ssl.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace QManager{
    struct Tls_Settings{
        // PKCS#12 bundle: certificate, private key and the ascending chain.
        std::optional<std::string> certificate;
        std::string certificate_password;
        // PEM files of additional trusted CAs.
        std::vector<std::string> ca_files;
        bool system_ca = true;
    };

    class Tls_Stream : public Stream{
    private:
        File_Descriptor _fd;
        SSL* _ssl;
        std::string _peer;
    public:
        Tls_Stream(File_Descriptor fd, SSL* ssl, std::string peer);
        ~Tls_Stream() override;
        Tls_Stream(Tls_Stream const&) = delete;
        Tls_Stream& operator=(Tls_Stream const&) = delete;

        std::size_t read_some(char* buffer, std::size_t size) override;
        void write_all(char const* data, std::size_t size) override;
        void shutdown() override;
        std::string const& peer() const override;
    };

    class Tls_Context{
    private:
        struct Ctx_Deleter{
            void operator()(SSL_CTX* ctx) const;
        };
        std::unique_ptr<SSL_CTX, Ctx_Deleter> _ctx;

        explicit Tls_Context(SSL_CTX* ctx);
        void _load_certificate(std::string const& file, std::string const& password);
        void _load_trust(Tls_Settings const& settings);
    public:
        // Requires a certificate. Peers must present a certificate trusted by
        // ca_files when any are configured. Throws TLS_ERROR / IO_ERROR.
        static Tls_Context server(Tls_Settings const& settings);
        // Verifies the server against ca_files and the system store.
        static Tls_Context client(Tls_Settings const& settings);

        // Run the handshake on a connected socket. Throws TLS_ERROR.
        std::unique_ptr<Stream> accept(File_Descriptor fd, std::string const& peer) const;
        std::unique_ptr<Stream> connect(File_Descriptor fd, std::string const& host) const;
    };
}

#endif //QMANAGER_TLS_HPP
