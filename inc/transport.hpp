#ifndef __TRANSPORT_HPP__
#define __TRANSPORT_HPP__

#include <cstdint>
#include <map>
#include <string>

#include "byte_stream.hpp"
#include "ippo.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    #define IPP_DEFAULT_PORT            631
    #define IPP_CONTENT_TYPE            "application/ipp"
    #define HTTP_DEFAULT_TIMEOUT_MS     30000
    #define HTTP_MAX_HEADER_SIZE_BYTES  (64*1024)

    /* Request/response exchange of whole IPP messages */
    class transport_c
    {
      public:
        virtual ~transport_c() {};
        /* Sends request bytes and blocks for the complete response.  Response is replaced only on success. */
        virtual ippo_error_e send(const octet_buffer_t &request, octet_buffer_t *response) = 0;
    };

    typedef struct
    {
      std::string scheme;
      std::string host;
      uint16_t    port;
      /* Always begins with '/' */
      std::string path;
      bool        tls;
    } ipp_uri_s;

    /* Accepts ipp://, ipps://, http:// and https:// URIs.  ipp and ipps default to port 631. */
    bool parse_ipp_uri(const std::string &uri, ipp_uri_s *output);

    typedef struct
    {
      int                                status_code;
      /* Header names are lowercase */
      std::map<std::string, std::string> headers;
      octet_buffer_t                     body;
    } http_response_s;

    /* Builds a POST of body to uri with IPP content type */
    void build_http_post_request(const ipp_uri_s *uri, const octet_buffer_t &body, octet_buffer_t *output);

    /* Parses raw response bytes received so far.  Supports Content-Length, chunked and read-until-close framing.
        Returns IPPO_ERROR_TRUNCATED_INPUT if more bytes are needed, IPPO_ERROR_TRANSPORT if the response is malformed.
        On truncation needed_size, if not null, receives the raw size before which parsing again cannot succeed. */
    ippo_error_e parse_http_response(const octet_buffer_t &raw, bool connection_closed, http_response_s *output,
                                     size_t *needed_size = nullptr);

    typedef struct
    {
      bool         verbose;
      /* Socket send and receive timeout */
      unsigned int timeout_ms;
      /* Verify printer certificate for ipps.  Off by default since printers commonly use self-signed certificates. */
      bool         verify_peer;
    } http_transport_config_s;

    /* One HTTP/1.1 POST per send over a fresh TCP connection, TLS for ipps/https */
    class http_transport_c : public transport_c
    {
      private:
        http_transport_config_s config;
        ipp_uri_s               uri;
        bool                    uri_valid;

      public:
        static void init_config(http_transport_config_s*);

        http_transport_c(const std::string &printer_uri, const http_transport_config_s *config = nullptr);

        inline bool             is_valid() const {return uri_valid;};
        inline const ipp_uri_s &get_uri()  const {return uri;};

        ippo_error_e send(const octet_buffer_t &request, octet_buffer_t *response) override;
    };
  }
}

#endif /* __TRANSPORT_HPP__ */
