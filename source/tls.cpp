#include "error.hpp"
#include "log.hpp"
#include "slurp.hpp"
#include "tls.hpp"

#include <fmt/core.h>

#include <openssl/err.h>
#include <openssl/pkcs12.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <utility>

namespace QManager{
    namespace{
        std::string openssl_errors(){
            std::string result;
            while( auto code = ERR_get_error() ){
                char buf[256];
                ERR_error_string_n(code, buf, sizeof(buf));
                if( !result.empty() ){
                    result += "; ";
                }
                result += buf;
            }
            return result.empty() ? "unknown error" : result;
        }

        Error tls_error(std::string const& what){
            return Error(Error_Kind::TLS_ERROR, fmt::format("{}: {}", what, openssl_errors()));
        }

        bool is_ip_address(std::string const& host){
            unsigned char buf[sizeof(in6_addr)];
            return inet_pton(AF_INET, host.c_str(), buf) == 1 || inet_pton(AF_INET6, host.c_str(), buf) == 1;
        }

        SSL_CTX* new_context(SSL_METHOD const* method){
            ignore_sigpipe();
            SSL_CTX* ctx = SSL_CTX_new(method);
            if( ctx == nullptr ){
                throw tls_error("SSL_CTX_new() failed");
            }
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
            SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
            return ctx;
        }

        // Handshake failures carry the certificate verification result if any.
        Error handshake_error(SSL* ssl, std::string const& peer){
            auto verify = SSL_get_verify_result(ssl);
            if( verify != X509_V_OK ){
                ERR_clear_error();
                return Error(Error_Kind::TLS_ERROR, fmt::format("TLS handshake with {} failed: {}",
                             peer, X509_verify_cert_error_string(verify)));
            }
            return tls_error(fmt::format("TLS handshake with {} failed", peer));
        }
    }

    Tls_Stream::Tls_Stream(File_Descriptor fd, SSL* ssl, std::string peer)
    : _fd(std::move(fd))
    , _ssl(ssl)
    , _peer(std::move(peer))
    {}

    Tls_Stream::~Tls_Stream(){
        SSL_shutdown(_ssl);
        SSL_free(_ssl);
        ERR_clear_error();
    }

    std::size_t Tls_Stream::read_some(char* buffer, std::size_t size){
        int n = SSL_read(_ssl, buffer, static_cast<int>(std::min<std::size_t>(size, INT_MAX)));
        if( n > 0 ){
            return static_cast<std::size_t>(n);
        }
        switch( SSL_get_error(_ssl, n) ){
            case SSL_ERROR_ZERO_RETURN:
                return 0;
            case SSL_ERROR_SYSCALL:
                if( ERR_peek_error() == 0 ){
                    if( n == 0 || errno == 0 ){
                        return 0;
                    }
                    throw system_error(Error_Kind::IO_ERROR, "TLS read failed", errno);
                }
                [[fallthrough]];
            default:
                throw tls_error("TLS read failed");
        }
    }

    void Tls_Stream::write_all(char const* data, std::size_t size){
        std::size_t done = 0;
        while( done < size ){
            int n = SSL_write(_ssl, data + done, static_cast<int>(std::min<std::size_t>(size - done, INT_MAX)));
            if( n <= 0 ){
                if( SSL_get_error(_ssl, n) == SSL_ERROR_SYSCALL && ERR_peek_error() == 0 ){
                    throw system_error(Error_Kind::IO_ERROR, "TLS write failed", errno);
                }
                throw tls_error("TLS write failed");
            }
            done += static_cast<std::size_t>(n);
        }
    }

    void Tls_Stream::shutdown(){
        ::shutdown(_fd.get(), SHUT_RDWR);
    }

    std::string const& Tls_Stream::peer() const{
        return _peer;
    }

    void Tls_Context::Ctx_Deleter::operator()(SSL_CTX* ctx) const{
        SSL_CTX_free(ctx);
    }

    Tls_Context::Tls_Context(SSL_CTX* ctx)
    : _ctx(ctx)
    {}

    void Tls_Context::_load_certificate(std::string const& file, std::string const& password){
        auto data = slurp(file);
        std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())), &BIO_free);
        std::unique_ptr<PKCS12, decltype(&PKCS12_free)> p12(d2i_PKCS12_bio(bio.get(), nullptr), &PKCS12_free);
        if( !p12 ){
            throw tls_error(fmt::format("{} is not a PKCS#12 bundle", file));
        }
        EVP_PKEY* raw_key = nullptr;
        X509* raw_cert = nullptr;
        STACK_OF(X509)* raw_chain = nullptr;
        if( PKCS12_parse(p12.get(), password.c_str(), &raw_key, &raw_cert, &raw_chain) != 1 ){
            throw tls_error(fmt::format("Cannot decode PKCS#12 bundle {}", file));
        }
        std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(raw_key, &EVP_PKEY_free);
        std::unique_ptr<X509, decltype(&X509_free)> cert(raw_cert, &X509_free);
        auto free_chain = [](STACK_OF(X509)* chain){ sk_X509_pop_free(chain, X509_free); };
        std::unique_ptr<STACK_OF(X509), decltype(free_chain)> chain(raw_chain, free_chain);

        if( !cert || !key ){
            throw Error(Error_Kind::TLS_ERROR, fmt::format("PKCS#12 bundle {} lacks a certificate or key.", file));
        }
        if( SSL_CTX_use_certificate(_ctx.get(), cert.get()) != 1
            || SSL_CTX_use_PrivateKey(_ctx.get(), key.get()) != 1 ){
            throw tls_error(fmt::format("Cannot use certificate from {}", file));
        }
        if( chain ){
            for( int i = 0; i < sk_X509_num(chain.get()); ++i ){
                if( SSL_CTX_add1_chain_cert(_ctx.get(), sk_X509_value(chain.get(), i)) != 1 ){
                    throw tls_error(fmt::format("Cannot add chain certificate from {}", file));
                }
            }
        }
        if( SSL_CTX_check_private_key(_ctx.get()) != 1 ){
            throw tls_error(fmt::format("Private key in {} does not match its certificate", file));
        }
    }

    void Tls_Context::_load_trust(Tls_Settings const& settings){
        for( auto const& ca : settings.ca_files ){
            if( SSL_CTX_load_verify_locations(_ctx.get(), ca.c_str(), nullptr) != 1 ){
                throw tls_error(fmt::format("Cannot load CA certificate {}", ca));
            }
            log(fmt::format("Trusting CA certificates from {}.", ca), Message_Type::DEBUG);
        }
        if( settings.system_ca && SSL_CTX_set_default_verify_paths(_ctx.get()) != 1 ){
            throw tls_error("Cannot load the system trust store");
        }
    }

    Tls_Context Tls_Context::server(Tls_Settings const& settings){
        Tls_Context context(new_context(TLS_server_method()));
        if( !settings.certificate.has_value() ){
            throw Error(Error_Kind::CONFIG_CONFLICT, "A TLS server needs a certificate.");
        }
        context._load_certificate(*settings.certificate, settings.certificate_password);
        if( !settings.ca_files.empty() ){
            context._load_trust(settings);
            SSL_CTX_set_verify(context._ctx.get(), SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);
        }
        return context;
    }

    Tls_Context Tls_Context::client(Tls_Settings const& settings){
        Tls_Context context(new_context(TLS_client_method()));
        if( settings.certificate.has_value() ){
            context._load_certificate(*settings.certificate, settings.certificate_password);
        }
        context._load_trust(settings);
        SSL_CTX_set_verify(context._ctx.get(), SSL_VERIFY_PEER, nullptr);
        return context;
    }

    std::unique_ptr<Stream> Tls_Context::accept(File_Descriptor fd, std::string const& peer) const
    {
        SSL* ssl = SSL_new(_ctx.get());
        if( ssl == nullptr ){
            throw tls_error("SSL_new() failed");
        }
        SSL_set_fd(ssl, fd.get());
        if( SSL_accept(ssl) != 1 ){
            auto error = handshake_error(ssl, peer);
            SSL_free(ssl);
            throw error;
        }
        return std::make_unique<Tls_Stream>(std::move(fd), ssl, peer);
    }

    std::unique_ptr<Stream> Tls_Context::connect(File_Descriptor fd, std::string const& host) const
    {
        SSL* ssl = SSL_new(_ctx.get());
        if( ssl == nullptr ){
            throw tls_error("SSL_new() failed");
        }
        SSL_set_fd(ssl, fd.get());
        bool named;
        if( is_ip_address(host) ){
            named = X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), host.c_str()) == 1;
        }else{
            named = SSL_set_tlsext_host_name(ssl, host.c_str()) == 1 && SSL_set1_host(ssl, host.c_str()) == 1;
        }
        if( !named ){
            SSL_free(ssl);
            throw tls_error(fmt::format("Cannot verify host name {}", host));
        }
        if( SSL_connect(ssl) != 1 ){
            auto error = handshake_error(ssl, host);
            SSL_free(ssl);
            throw error;
        }
        return std::make_unique<Tls_Stream>(std::move(fd), ssl, host);
    }
}
