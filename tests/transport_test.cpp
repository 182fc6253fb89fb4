#include <arpa/inet.h>
#include <cstring>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <pthread.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

#include "transport.hpp"

using namespace sandor_laboratories::ippo;

static octet_buffer_t to_octets(const std::string &text)
{
  return octet_buffer_t(text.begin(), text.end());
}

TEST(ipp_uri, ipp_scheme_defaults)
{
  ipp_uri_s uri;

  ASSERT_TRUE(parse_ipp_uri("ipp://printer.local/ipp/print", &uri));
  EXPECT_EQ("ipp",           uri.scheme);
  EXPECT_EQ("printer.local", uri.host);
  EXPECT_EQ(631,             uri.port);
  EXPECT_EQ("/ipp/print",    uri.path);
  EXPECT_FALSE(uri.tls);
}

TEST(ipp_uri, explicit_port_and_ipv6)
{
  ipp_uri_s uri;

  ASSERT_TRUE(parse_ipp_uri("ipps://[fe80::1]:8631/ipp/print", &uri));
  EXPECT_EQ("fe80::1", uri.host);
  EXPECT_EQ(8631,      uri.port);
  EXPECT_TRUE(uri.tls);

  ASSERT_TRUE(parse_ipp_uri("IPP://192.168.1.20:6310", &uri));
  EXPECT_EQ("ipp",          uri.scheme);
  EXPECT_EQ("192.168.1.20", uri.host);
  EXPECT_EQ(6310,           uri.port);
  EXPECT_EQ("/",            uri.path);
}

TEST(ipp_uri, http_schemes_and_userinfo)
{
  ipp_uri_s uri;

  ASSERT_TRUE(parse_ipp_uri("http://user@printer/ipp", &uri));
  EXPECT_EQ("printer", uri.host);
  EXPECT_EQ(80,        uri.port);
  EXPECT_FALSE(uri.tls);

  ASSERT_TRUE(parse_ipp_uri("https://printer/ipp", &uri));
  EXPECT_EQ(443, uri.port);
  EXPECT_TRUE(uri.tls);
}

TEST(ipp_uri, rejects_invalid)
{
  ipp_uri_s uri;

  EXPECT_FALSE(parse_ipp_uri("printer.local/ipp/print", &uri));
  EXPECT_FALSE(parse_ipp_uri("ftp://printer/ipp", &uri));
  EXPECT_FALSE(parse_ipp_uri("ipp:///ipp/print", &uri));
  EXPECT_FALSE(parse_ipp_uri("ipp://printer:0/ipp", &uri));
  EXPECT_FALSE(parse_ipp_uri("ipp://printer:70000/ipp", &uri));
  EXPECT_FALSE(parse_ipp_uri("ipp://printer:port/ipp", &uri));
  EXPECT_FALSE(parse_ipp_uri("ipp://[fe80::1/ipp", &uri));
}

TEST(http, post_request_head)
{
  ipp_uri_s      uri;
  octet_buffer_t request;
  const octet_buffer_t body = {0x01, 0x01, 0x00, 0x0B};

  ASSERT_TRUE(parse_ipp_uri("ipp://printer.local/ipp/print", &uri));
  build_http_post_request(&uri, body, &request);

  const std::string text(request.begin(), request.end());
  EXPECT_EQ(0u, text.find("POST /ipp/print HTTP/1.1\r\n"));
  EXPECT_NE(std::string::npos, text.find("Host: printer.local:631\r\n"));
  EXPECT_NE(std::string::npos, text.find("Content-Type: application/ipp\r\n"));
  EXPECT_NE(std::string::npos, text.find("Content-Length: 4\r\n"));
  EXPECT_NE(std::string::npos, text.find("Connection: close\r\n"));
  EXPECT_EQ(body, octet_buffer_t(request.end() - 4, request.end()));
}

TEST(http, content_length_framing)
{
  http_response_s response;
  const std::string head = "HTTP/1.1 200 OK\r\nContent-Type: application/ipp\r\nCONTENT-LENGTH: 3\r\n\r\n";

  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT, parse_http_response(to_octets(head + "ab"), false, &response));
  ASSERT_EQ(IPPO_ERROR_NONE, parse_http_response(to_octets(head + "abc"), false, &response));
  EXPECT_EQ(200, response.status_code);
  EXPECT_EQ("application/ipp", response.headers["content-type"]);
  EXPECT_EQ(to_octets("abc"), response.body);
}

TEST(http, chunked_framing)
{
  http_response_s response;
  const std::string message = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                              "3\r\nabc\r\n"
                              "2;name=value\r\nde\r\n"
                              "0\r\n\r\n";

  ASSERT_EQ(IPPO_ERROR_NONE, parse_http_response(to_octets(message), false, &response));
  EXPECT_EQ(to_octets("abcde"), response.body);

  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT, parse_http_response(to_octets(message.substr(0, message.size()-2)), false, &response));
  EXPECT_EQ(IPPO_ERROR_TRANSPORT,
            parse_http_response(to_octets("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"), false, &response));
}

TEST(http, truncation_reports_needed_size)
{
  http_response_s   response;
  size_t            needed_size = 0;
  const std::string length_head  = "HTTP/1.1 200 OK\r\nContent-Length: 5000\r\n\r\n";
  const std::string chunked_head = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n";
  const std::string partial_head = "HTTP/1.1 200 OK\r\nContent-Le";

  /* Body bytes still missing */
  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT, parse_http_response(to_octets(length_head + "abc"), false, &response, &needed_size));
  EXPECT_EQ(length_head.size() + 5000, needed_size);

  /* Rest of the current chunk and its CRLF */
  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT,
            parse_http_response(to_octets(chunked_head + "3\r\nabc\r\n10\r\nxy"), false, &response, &needed_size));
  EXPECT_EQ(chunked_head.size() + 8 + 4 + 16 + 2, needed_size);

  /* Incomplete head needs any further byte */
  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT, parse_http_response(to_octets(partial_head), false, &response, &needed_size));
  EXPECT_EQ(partial_head.size() + 1, needed_size);

  /* Without framing only the close completes the body */
  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT,
            parse_http_response(to_octets("HTTP/1.0 200 OK\r\n\r\nsome"), false, &response, &needed_size));
  EXPECT_EQ(SIZE_MAX, needed_size);
}

TEST(http, interim_response_skipped)
{
  http_response_s response;
  const std::string message = "HTTP/1.1 100 Continue\r\n\r\n"
                              "HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\nx";

  ASSERT_EQ(IPPO_ERROR_NONE, parse_http_response(to_octets(message), false, &response));
  EXPECT_EQ(200, response.status_code);
  EXPECT_EQ(to_octets("x"), response.body);

  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT, parse_http_response(to_octets("HTTP/1.1 100 Continue\r\n\r\n"), false, &response));
}

TEST(http, read_until_close)
{
  http_response_s response;
  const octet_buffer_t raw = to_octets("HTTP/1.0 200 OK\r\n\r\nbody bytes");

  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT, parse_http_response(raw, false, &response));
  ASSERT_EQ(IPPO_ERROR_NONE, parse_http_response(raw, true, &response));
  EXPECT_EQ(to_octets("body bytes"), response.body);
}

TEST(http, malformed_responses)
{
  http_response_s response;

  EXPECT_EQ(IPPO_ERROR_TRANSPORT, parse_http_response(to_octets("SMTP ready\r\n\r\n"), true, &response));
  EXPECT_EQ(IPPO_ERROR_TRANSPORT, parse_http_response(to_octets("HTTP/1.1 OK\r\n\r\n"), true, &response));
  EXPECT_EQ(IPPO_ERROR_TRANSPORT, parse_http_response(to_octets("HTTP/1.1 200 OK\r\nNoColon\r\n\r\n"), true, &response));
  EXPECT_EQ(IPPO_ERROR_TRANSPORT, parse_http_response(to_octets("HTTP/1.1 200 OK\r\nContent-Length: -1\r\n\r\n"), true, &response));
  EXPECT_EQ(IPPO_ERROR_TRANSPORT,
            parse_http_response(octet_buffer_t(HTTP_MAX_HEADER_SIZE_BYTES + 1, 'a'), false, &response));
}

/* Loopback server answering one connection with a canned response */
typedef struct
{
  int            listen_fd;
  std::string    response;
  octet_buffer_t received;
} loopback_server_s;

static void *loopback_server_thread_f(void *arg)
{
  loopback_server_s *server = (loopback_server_s *) arg;
  int                client_fd = accept(server->listen_fd, nullptr, nullptr);
  octet_t            chunk[1024];
  ssize_t            read_size = 0;
  std::string        text;
  size_t             head_end = std::string::npos;
  size_t             content_length = 0;

  if(client_fd < 0)
  {
    return nullptr;
  }

  while((read_size = recv(client_fd, chunk, sizeof(chunk), 0)) > 0)
  {
    server->received.insert(server->received.end(), chunk, chunk+read_size);
    text.assign(server->received.begin(), server->received.end());
    head_end = text.find("\r\n\r\n");
    if(std::string::npos != head_end)
    {
      sscanf(text.c_str() + text.find("Content-Length: ") + 16, "%zu", &content_length);
      if(text.size() >= (head_end + 4 + content_length))
      {
        break;
      }
    }
  }

  send(client_fd, server->response.data(), server->response.size(), MSG_NOSIGNAL);
  close(client_fd);

  return nullptr;
}

class http_transport_test : public ::testing::Test
{
  protected:
    loopback_server_s server;
    pthread_t         server_thread;
    uint16_t          port;

    void SetUp() override
    {
      struct sockaddr_in address;
      socklen_t          address_length = sizeof(address);

      server.listen_fd = socket(AF_INET, SOCK_STREAM, 0);
      ASSERT_GE(server.listen_fd, 0);

      memset(&address, 0, sizeof(address));
      address.sin_family      = AF_INET;
      address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
      address.sin_port        = 0;
      ASSERT_EQ(0, bind(server.listen_fd, (struct sockaddr *) &address, sizeof(address)));
      ASSERT_EQ(0, listen(server.listen_fd, 1));
      ASSERT_EQ(0, getsockname(server.listen_fd, (struct sockaddr *) &address, &address_length));
      port = ntohs(address.sin_port);
    }

    void TearDown() override
    {
      close(server.listen_fd);
    }

    ippo_error_e exchange(const std::string &canned_response, const octet_buffer_t &request, octet_buffer_t *response)
    {
      ippo_error_e ret_val;

      server.response = canned_response;
      EXPECT_EQ(0, pthread_create(&server_thread, nullptr, loopback_server_thread_f, &server));

      http_transport_c transport("ipp://127.0.0.1:" + std::to_string(port) + "/ipp/print");
      EXPECT_TRUE(transport.is_valid());
      ret_val = transport.send(request, response);

      EXPECT_EQ(0, pthread_join(server_thread, nullptr));
      return ret_val;
    }
};

TEST_F(http_transport_test, post_and_receive)
{
  const octet_buffer_t request = {0x01, 0x01, 0x00, 0x0B, 0x00, 0x00, 0x00, 0x01, 0x03};
  octet_buffer_t       response;

  ASSERT_EQ(IPPO_ERROR_NONE, exchange("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nippo", request, &response));
  EXPECT_EQ(to_octets("ippo"), response);

  const std::string received(server.received.begin(), server.received.end());
  EXPECT_EQ(0u, received.find("POST /ipp/print HTTP/1.1\r\n"));
  EXPECT_EQ(request, octet_buffer_t(server.received.end() - request.size(), server.received.end()));
}

TEST_F(http_transport_test, large_body_over_many_reads)
{
  const std::string body(200000, 'j');
  octet_buffer_t    response;

  ASSERT_EQ(IPPO_ERROR_NONE,
            exchange("HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body,
                     octet_buffer_t(1, 0x03), &response));
  EXPECT_EQ(to_octets(body), response);
}

TEST_F(http_transport_test, non_success_status_is_transport_error)
{
  octet_buffer_t response = to_octets("untouched");

  EXPECT_EQ(IPPO_ERROR_TRANSPORT, exchange("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n", octet_buffer_t(1, 0x03), &response));
  EXPECT_EQ(to_octets("untouched"), response);
}

TEST_F(http_transport_test, early_close_is_transport_error)
{
  octet_buffer_t response;

  EXPECT_EQ(IPPO_ERROR_TRANSPORT, exchange("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc", octet_buffer_t(1, 0x03), &response));
}

TEST(http_transport, invalid_uri)
{
  http_transport_c transport("lpd://printer/queue");
  octet_buffer_t   response;

  EXPECT_FALSE(transport.is_valid());
  EXPECT_EQ(IPPO_ERROR_INVALID_ARGUMENT, transport.send(octet_buffer_t(), &response));
}
