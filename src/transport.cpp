#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <netdb.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

#include "transport.hpp"
#include "version.hpp"

using namespace sandor_laboratories::ippo;

#define HTTP_READ_CHUNK_SIZE 4096
#define HTTP_DEFAULT_PORT    80
#define HTTPS_DEFAULT_PORT   443

static const char http_line_end[]   = "\r\n";
static const char http_header_end[] = "\r\n\r\n";

inline std::string lowercase(const std::string &text)
{
  std::string ret_string = text;
  std::transform(ret_string.begin(), ret_string.end(), ret_string.begin(), [](unsigned char c){return (char) tolower(c);});
  return ret_string;
}

inline std::string trim(const std::string &text)
{
  const size_t first = text.find_first_not_of(" \t");
  const size_t last  = text.find_last_not_of(" \t");
  return ((std::string::npos == first)?std::string():text.substr(first, (last-first)+1));
}

/* Parses decimal digits only.  Returns false on empty input, other characters, or value above max. */
inline bool parse_unsigned(const std::string &text, unsigned long max, unsigned long *value)
{
  bool ret_val = (!text.empty() && (text.size() <= 20) &&
                  (std::string::npos == text.find_first_not_of("0123456789")));

  if(ret_val)
  {
    errno  = 0;
    *value = strtoul(text.c_str(), nullptr, 10);
    ret_val = ((0 == errno) && (*value <= max));
  }

  return ret_val;
}

bool sandor_laboratories::ippo::parse_ipp_uri(const std::string &uri_string, ipp_uri_s *output)
{
  bool          ret_val = true;
  ipp_uri_s     uri;
  std::string   authority;
  std::string   port_string;
  unsigned long port = 0;
  size_t        position = uri_string.find("://");

  if((output == nullptr) || (std::string::npos == position))
  {
    fprintf(stderr, "Invalid printer URI '%s'.\n", uri_string.c_str());
    return false;
  }

  uri.scheme = lowercase(uri_string.substr(0, position));
  if("ipp" == uri.scheme)
  {
    uri.port = IPP_DEFAULT_PORT;
    uri.tls  = false;
  }
  else if("ipps" == uri.scheme)
  {
    uri.port = IPP_DEFAULT_PORT;
    uri.tls  = true;
  }
  else if("http" == uri.scheme)
  {
    uri.port = HTTP_DEFAULT_PORT;
    uri.tls  = false;
  }
  else if("https" == uri.scheme)
  {
    uri.port = HTTPS_DEFAULT_PORT;
    uri.tls  = true;
  }
  else
  {
    fprintf(stderr, "Unsupported printer URI scheme '%s'.\n", uri.scheme.c_str());
    return false;
  }

  authority = uri_string.substr(position+3);
  position  = authority.find('/');
  uri.path  = ((std::string::npos == position)?"/":authority.substr(position));
  authority = authority.substr(0, position);

  /* userinfo is not used */
  position = authority.rfind('@');
  if(std::string::npos != position)
  {
    authority = authority.substr(position+1);
  }

  if(!authority.empty() && ('[' == authority[0]))
  {
    /* IPv6 literal */
    position = authority.find(']');
    if(std::string::npos == position)
    {
      ret_val = false;
    }
    else
    {
      uri.host    = authority.substr(1, position-1);
      port_string = authority.substr(position+1);
      if(!port_string.empty())
      {
        ret_val     = (':' == port_string[0]);
        port_string = port_string.substr(1);
        ret_val     = ret_val && parse_unsigned(port_string, UINT16_MAX, &port) && (port > 0);
      }
    }
  }
  else
  {
    position = authority.find(':');
    uri.host = authority.substr(0, position);
    if(std::string::npos != position)
    {
      ret_val = parse_unsigned(authority.substr(position+1), UINT16_MAX, &port) && (port > 0);
    }
  }

  if(ret_val && (port > 0))
  {
    uri.port = (uint16_t) port;
  }

  if(!ret_val || uri.host.empty())
  {
    fprintf(stderr, "Invalid host or port in printer URI '%s'.\n", uri_string.c_str());
    ret_val = false;
  }
  else
  {
    *output = uri;
  }

  return ret_val;
}

void sandor_laboratories::ippo::build_http_post_request(const ipp_uri_s *uri, const octet_buffer_t &body, octet_buffer_t *output)
{
  char        length_string[32];
  std::string host = ((std::string::npos != uri->host.find(':'))?("[" + uri->host + "]"):uri->host);
  std::string head;

  snprintf(length_string, sizeof(length_string), "%zu", body.size());

  head  = "POST " + uri->path + " HTTP/1.1" + http_line_end;
  head += "Host: " + host + ":" + std::to_string(uri->port) + http_line_end;
  head += std::string("Content-Type: ") + IPP_CONTENT_TYPE + http_line_end;
  head += std::string("Content-Length: ") + length_string + http_line_end;
  head += std::string("Accept: ") + IPP_CONTENT_TYPE + http_line_end;
  head += std::string("User-Agent: ") + PROJECT_NAME "/" PROJECT_VER + http_line_end;
  head += std::string("Connection: close") + http_line_end;
  head += http_line_end;

  write_string(output, head);
  write_bytes(output, body);
}

/* Returns position of pattern in raw at or after start, or npos */
inline size_t find_pattern(const octet_buffer_t &raw, size_t start, const char *pattern)
{
  const size_t                   pattern_length = strlen(pattern);
  octet_buffer_t::const_iterator it;

  if(start > raw.size())
  {
    return std::string::npos;
  }

  it = std::search(raw.begin()+start, raw.end(), pattern, pattern+pattern_length);

  return ((raw.end() == it)?std::string::npos:(size_t) (it - raw.begin()));
}

inline std::string raw_string(const octet_buffer_t &raw, size_t start, size_t end)
{
  return std::string((const char *) raw.data() + start, end - start);
}

/* Parses status line and headers in raw[start, end) */
static ippo_error_e parse_http_head(const octet_buffer_t &raw, size_t start, size_t end, http_response_s *response)
{
  ippo_error_e  ret_val = IPPO_ERROR_NONE;
  std::string   line;
  size_t        line_end = find_pattern(raw, start, http_line_end);
  size_t        position = 0;
  unsigned long status_code = 0;

  line = raw_string(raw, start, MIN(line_end, end));
  if( (0 != line.compare(0, 5, "HTTP/")) ||
      (std::string::npos == (position = line.find(' '))) ||
      !parse_unsigned(line.substr(position+1, 3), 999, &status_code) )
  {
    fprintf(stderr, "Malformed HTTP status line '%s'.\n", line.c_str());
    return IPPO_ERROR_TRANSPORT;
  }

  response->status_code = (int) status_code;
  response->headers.clear();

  while((IPPO_ERROR_NONE == ret_val) && (line_end < end))
  {
    start    = line_end + 2;
    line_end = find_pattern(raw, start, http_line_end);
    line     = raw_string(raw, start, MIN(line_end, end));
    if(line.empty())
    {
      break;
    }

    position = line.find(':');
    if((std::string::npos == position) || (0 == position))
    {
      fprintf(stderr, "Malformed HTTP header '%s'.\n", line.c_str());
      ret_val = IPPO_ERROR_TRANSPORT;
    }
    else
    {
      response->headers[lowercase(trim(line.substr(0, position)))] = trim(line.substr(position+1));
    }
  }

  return ret_val;
}

/* On truncation, needed_size is the raw size worth parsing again at */
static ippo_error_e decode_chunked_body(const octet_buffer_t &raw, size_t position, octet_buffer_t *body, size_t *needed_size)
{
  size_t        line_end = 0;
  std::string   size_string;
  unsigned long chunk_size = 0;
  char         *parse_end = nullptr;

  body->clear();

  while(true)
  {
    line_end = find_pattern(raw, position, http_line_end);
    if(std::string::npos == line_end)
    {
      *needed_size = raw.size() + 1;
      return IPPO_ERROR_TRUNCATED_INPUT;
    }

    /* Chunk extensions after ';' are ignored */
    size_string = raw_string(raw, position, line_end);
    size_string = trim(size_string.substr(0, size_string.find(';')));
    errno       = 0;
    chunk_size  = strtoul(size_string.c_str(), &parse_end, 16);
    if(size_string.empty() || (0 != errno) || (*parse_end != '\0'))
    {
      fprintf(stderr, "Malformed HTTP chunk size '%s'.\n", size_string.c_str());
      return IPPO_ERROR_TRANSPORT;
    }
    position = line_end + 2;

    if(0 == chunk_size)
    {
      break;
    }

    if(((raw.size() - position) < 2) || ((raw.size() - position - 2) < chunk_size))
    {
      *needed_size = position + chunk_size + 2;
      return IPPO_ERROR_TRUNCATED_INPUT;
    }
    if(('\r' != raw[position+chunk_size]) || ('\n' != raw[position+chunk_size+1]))
    {
      fprintf(stderr, "HTTP chunk of %lu bytes not terminated by CRLF.\n", chunk_size);
      return IPPO_ERROR_TRANSPORT;
    }
    body->insert(body->end(), raw.begin()+position, raw.begin()+position+chunk_size);
    position += chunk_size + 2;
  }

  /* Trailers end with an empty line */
  while(true)
  {
    line_end = find_pattern(raw, position, http_line_end);
    if(std::string::npos == line_end)
    {
      *needed_size = raw.size() + 1;
      return IPPO_ERROR_TRUNCATED_INPUT;
    }
    if(line_end == position)
    {
      break;
    }
    position = line_end + 2;
  }

  return IPPO_ERROR_NONE;
}

ippo_error_e sandor_laboratories::ippo::parse_http_response(const octet_buffer_t &raw, bool connection_closed, http_response_s *output,
                                                         size_t *needed_size)
{
  ippo_error_e    ret_val = IPPO_ERROR_NONE;
  http_response_s response;
  size_t          head_start = 0;
  size_t          head_end = 0;
  size_t          body_start = 0;
  size_t          needed = raw.size() + 1;
  unsigned long   content_length = 0;
  std::map<std::string, std::string>::const_iterator header;

  if(output == nullptr)
  {
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  /* Skip interim 1xx responses */
  do
  {
    head_end = find_pattern(raw, head_start, http_header_end);
    if(std::string::npos == head_end)
    {
      if((raw.size() - head_start) > HTTP_MAX_HEADER_SIZE_BYTES)
      {
        fprintf(stderr, "HTTP response header exceeds %u bytes.\n", HTTP_MAX_HEADER_SIZE_BYTES);
        return IPPO_ERROR_TRANSPORT;
      }
      if(needed_size != nullptr)
      {
        *needed_size = needed;
      }
      return IPPO_ERROR_TRUNCATED_INPUT;
    }

    ret_val = parse_http_head(raw, head_start, head_end, &response);
    head_start = head_end + 4;
  } while((IPPO_ERROR_NONE == ret_val) && (response.status_code >= 100) && (response.status_code < 200));

  body_start = head_start;

  if(IPPO_ERROR_NONE == ret_val)
  {
    header = response.headers.find("transfer-encoding");
    if((response.headers.end() != header) && (std::string::npos != lowercase(header->second).find("chunked")))
    {
      ret_val = decode_chunked_body(raw, body_start, &response.body, &needed);
    }
    else if(response.headers.end() != (header = response.headers.find("content-length")))
    {
      if(!parse_unsigned(header->second, SIZE_MAX, &content_length))
      {
        fprintf(stderr, "Malformed HTTP Content-Length '%s'.\n", header->second.c_str());
        ret_val = IPPO_ERROR_TRANSPORT;
      }
      else if((raw.size() - body_start) < content_length)
      {
        needed  = body_start + content_length;
        ret_val = IPPO_ERROR_TRUNCATED_INPUT;
      }
      else
      {
        response.body.assign(raw.begin()+body_start, raw.begin()+body_start+content_length);
      }
    }
    else if(connection_closed)
    {
      response.body.assign(raw.begin()+body_start, raw.end());
    }
    else
    {
      /* Only the close completes the body */
      needed  = SIZE_MAX;
      ret_val = IPPO_ERROR_TRUNCATED_INPUT;
    }
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    *output = std::move(response);
  }
  else if((IPPO_ERROR_TRUNCATED_INPUT == ret_val) && (needed_size != nullptr))
  {
    *needed_size = needed;
  }

  return ret_val;
}

/* TCP connection, optionally wrapped in TLS.  Closed on destruction. */
class http_connection_c
{
  private:
    int      sockfd;
    SSL_CTX *ssl_ctx;
    SSL     *ssl;

    ippo_error_e start_tls(const ipp_uri_s *uri, const http_transport_config_s *config);

  public:
    http_connection_c() : sockfd(-1), ssl_ctx(nullptr), ssl(nullptr) {};
    ~http_connection_c();

    ippo_error_e open(const ipp_uri_s *uri, const http_transport_config_s *config);
    ippo_error_e write_all(const octet_buffer_t &data);
    /* Returns bytes read, 0 when the peer closed the connection, or -1 on error */
    ssize_t      read_some(octet_t *buffer, size_t size);
};

http_connection_c::~http_connection_c()
{
  if(ssl != nullptr)
  {
    SSL_shutdown(ssl);
    SSL_free(ssl);
  }
  if(ssl_ctx != nullptr)
  {
    SSL_CTX_free(ssl_ctx);
  }
  if(sockfd >= 0)
  {
    close(sockfd);
  }
}

ippo_error_e http_connection_c::open(const ipp_uri_s *uri, const http_transport_config_s *config)
{
  ippo_error_e     ret_val = IPPO_ERROR_NONE;
  struct addrinfo  hints;
  struct addrinfo *results = nullptr;
  char             port_string[8];
  int              rc = 0;
  struct timeval   timeout =
    {
      .tv_sec  = (time_t) (config->timeout_ms / 1000),
      .tv_usec = (suseconds_t) ((config->timeout_ms % 1000) * 1000),
    };

  memset(&hints, 0, sizeof(hints));
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  snprintf(port_string, sizeof(port_string), "%u", uri->port);

  rc = getaddrinfo(uri->host.c_str(), port_string, &hints, &results);
  if(0 != rc)
  {
    fprintf(stderr, "Failed to resolve printer host '%s'.  %s\n", uri->host.c_str(), gai_strerror(rc));
    return IPPO_ERROR_TRANSPORT;
  }

  for(struct addrinfo *result = results; result != nullptr; result = result->ai_next)
  {
    sockfd = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if(sockfd < 0)
    {
      continue;
    }

    setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
    setsockopt(sockfd, SOL_SOCKET, SO_SNDTIMEO, (const char*)&timeout, sizeof(timeout));

    if(0 == connect(sockfd, result->ai_addr, result->ai_addrlen))
    {
      break;
    }

    close(sockfd);
    sockfd = -1;
  }
  freeaddrinfo(results);

  if(sockfd < 0)
  {
    fprintf(stderr, "Failed to connect to %s:%u.  errno %u: %s\n", uri->host.c_str(), uri->port, errno, strerror(errno));
    ret_val = IPPO_ERROR_TRANSPORT;
  }
  else
  {
    if(config->verbose)
    {
      printf("Connected to %s:%u.\n", uri->host.c_str(), uri->port);
    }
    if(uri->tls)
    {
      ret_val = start_tls(uri, config);
    }
  }

  return ret_val;
}

ippo_error_e http_connection_c::start_tls(const ipp_uri_s *uri, const http_transport_config_s *config)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;

  ssl_ctx = SSL_CTX_new(TLS_client_method());
  if(ssl_ctx == nullptr)
  {
    fprintf(stderr, "Failed to create TLS context.\n");
    ERR_print_errors_fp(stderr);
    return IPPO_ERROR_TRANSPORT;
  }

  SSL_CTX_set_min_proto_version(ssl_ctx, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
  /* Many printers close without close_notify */
  SSL_CTX_set_options(ssl_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
  if(config->verify_peer)
  {
    SSL_CTX_set_verify(ssl_ctx, SSL_VERIFY_PEER, nullptr);
    if(1 != SSL_CTX_set_default_verify_paths(ssl_ctx))
    {
      fprintf(stderr, "Failed to load default certificate paths.\n");
      ERR_print_errors_fp(stderr);
      return IPPO_ERROR_TRANSPORT;
    }
  }
  else
  {
    SSL_CTX_set_verify(ssl_ctx, SSL_VERIFY_NONE, nullptr);
  }

  ssl = SSL_new(ssl_ctx);
  if((ssl == nullptr) || (1 != SSL_set_fd(ssl, sockfd)))
  {
    fprintf(stderr, "Failed to create TLS session.\n");
    ERR_print_errors_fp(stderr);
    return IPPO_ERROR_TRANSPORT;
  }

  if(1 != SSL_set_tlsext_host_name(ssl, uri->host.c_str()))
  {
    fprintf(stderr, "Failed to set TLS server name '%s'.\n", uri->host.c_str());
  }
  if(config->verify_peer && (1 != SSL_set1_host(ssl, uri->host.c_str())))
  {
    fprintf(stderr, "Failed to set TLS verification host '%s'.\n", uri->host.c_str());
    ret_val = IPPO_ERROR_TRANSPORT;
  }

  if((IPPO_ERROR_NONE == ret_val) && (1 != SSL_connect(ssl)))
  {
    fprintf(stderr, "TLS handshake with %s:%u failed.\n", uri->host.c_str(), uri->port);
    ERR_print_errors_fp(stderr);
    ret_val = IPPO_ERROR_TRANSPORT;
  }
  else if((IPPO_ERROR_NONE == ret_val) && config->verbose)
  {
    printf("TLS established.  %s %s\n", SSL_get_version(ssl), SSL_get_cipher(ssl));
  }

  return ret_val;
}

ippo_error_e http_connection_c::write_all(const octet_buffer_t &data)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;
  size_t       written = 0;
  ssize_t      rc = 0;

  while((IPPO_ERROR_NONE == ret_val) && (written < data.size()))
  {
    if(ssl != nullptr)
    {
      rc = SSL_write(ssl, &data[written], (int) MIN(data.size() - written, (size_t) INT32_MAX));
      if(rc <= 0)
      {
        fprintf(stderr, "TLS write failed.  SSL error %d\n", SSL_get_error(ssl, (int) rc));
        ERR_print_errors_fp(stderr);
        ret_val = IPPO_ERROR_TRANSPORT;
      }
    }
    else
    {
      rc = ::send(sockfd, &data[written], data.size() - written, MSG_NOSIGNAL);
      if((rc < 0) && (EINTR == errno))
      {
        continue;
      }
      if(rc <= 0)
      {
        fprintf(stderr, "Failed to send to socket.  errno %u: %s\n", errno, strerror(errno));
        ret_val = IPPO_ERROR_TRANSPORT;
      }
    }

    if(IPPO_ERROR_NONE == ret_val)
    {
      written += (size_t) rc;
    }
  }

  return ret_val;
}

ssize_t http_connection_c::read_some(octet_t *buffer, size_t size)
{
  ssize_t rc = 0;
  int     ssl_error = 0;

  if(ssl != nullptr)
  {
    rc = SSL_read(ssl, buffer, (int) MIN(size, (size_t) INT32_MAX));
    if(rc <= 0)
    {
      ssl_error = SSL_get_error(ssl, (int) rc);
      if((SSL_ERROR_ZERO_RETURN == ssl_error) || ((SSL_ERROR_SYSCALL == ssl_error) && (0 == errno)))
      {
        rc = 0;
      }
      else
      {
        fprintf(stderr, "TLS read failed.  SSL error %d\n", ssl_error);
        ERR_print_errors_fp(stderr);
        rc = -1;
      }
    }
  }
  else
  {
    do
    {
      rc = recv(sockfd, buffer, size, 0);
    } while((rc < 0) && (EINTR == errno));

    if(rc < 0)
    {
      fprintf(stderr, "Failed to receive from socket.  errno %u: %s\n", errno, strerror(errno));
    }
  }

  return rc;
}

void http_transport_c::init_config(http_transport_config_s *config)
{
  if(config != nullptr)
  {
    config->verbose     = false;
    config->timeout_ms  = HTTP_DEFAULT_TIMEOUT_MS;
    config->verify_peer = false;
  }
}

http_transport_c::http_transport_c(const std::string &printer_uri, const http_transport_config_s *config_)
  : uri(), uri_valid(false)
{
  init_config(&config);
  if(config_ != nullptr)
  {
    config = *config_;
  }

  uri_valid = parse_ipp_uri(printer_uri, &uri);
}

ippo_error_e http_transport_c::send(const octet_buffer_t &request, octet_buffer_t *response)
{
  ippo_error_e      ret_val = IPPO_ERROR_NONE;
  http_connection_c connection;
  octet_buffer_t    http_request;
  octet_buffer_t    raw;
  http_response_s   http_response;
  octet_t           chunk[HTTP_READ_CHUNK_SIZE];
  ssize_t           read_size = 0;
  size_t            needed_size = 0;
  bool              closed = false;

  if(!uri_valid || (response == nullptr))
  {
    fprintf(stderr, "Invalid transport state.  uri_valid %u response %p\n", uri_valid, response);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  build_http_post_request(&uri, request, &http_request);

  ret_val = connection.open(&uri, &config);
  if(IPPO_ERROR_NONE == ret_val)
  {
    if(config.verbose)
    {
      printf("POST %s (%zu bytes IPP).\n", uri.path.c_str(), request.size());
    }
    ret_val = connection.write_all(http_request);
  }

  while((IPPO_ERROR_NONE == ret_val) && !closed)
  {
    read_size = connection.read_some(chunk, sizeof(chunk));
    if(read_size < 0)
    {
      ret_val = IPPO_ERROR_TRANSPORT;
      break;
    }

    closed = (0 == read_size);
    raw.insert(raw.end(), chunk, chunk+read_size);

    /* Re-parse only once the bytes the last attempt was missing have arrived */
    if(closed || (raw.size() >= needed_size))
    {
      ret_val = parse_http_response(raw, closed, &http_response, &needed_size);
    }
    else
    {
      ret_val = IPPO_ERROR_TRUNCATED_INPUT;
    }

    if(IPPO_ERROR_TRUNCATED_INPUT == ret_val)
    {
      if(closed)
      {
        fprintf(stderr, "Connection closed before complete HTTP response.  received %zu bytes\n", raw.size());
        ret_val = IPPO_ERROR_TRANSPORT;
      }
      else
      {
        ret_val = IPPO_ERROR_NONE;
      }
    }
    else
    {
      break;
    }
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    if((http_response.status_code < 200) || (http_response.status_code > 299))
    {
      fprintf(stderr, "Printer returned HTTP status %d.\n", http_response.status_code);
      ret_val = IPPO_ERROR_TRANSPORT;
    }
    else
    {
      if(config.verbose)
      {
        printf("HTTP %d, %zu bytes IPP.\n", http_response.status_code, http_response.body.size());
      }
      *response = std::move(http_response.body);
    }
  }
  else if(IPPO_ERROR_TRANSPORT != ret_val)
  {
    ret_val = IPPO_ERROR_TRANSPORT;
  }

  return ret_val;
}
