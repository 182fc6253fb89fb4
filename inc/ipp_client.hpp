#ifndef __IPP_CLIENT_HPP__
#define __IPP_CLIENT_HPP__

#include <cstdint>
#include <pthread.h>

#include "ipp_message.hpp"
#include "ippo.hpp"
#include "transport.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    /* request-id is 1..2^31-1 (RFC 8011 4.1.2) */
    #define IPP_REQUEST_ID_MIN 1
    #define IPP_REQUEST_ID_MAX 0x7FFFFFFF

    /* Hands out request ids to concurrent callers sharing a printer session.  Wraps to 1 after the maximum. */
    class request_id_counter_c
    {
      private:
        pthread_mutex_t mutex = PTHREAD_MUTEX_INITIALIZER;
        uint32_t        next_id;

        void lock();
        void unlock();

      public:
        /* first_id outside 1..IPP_REQUEST_ID_MAX starts at 1 */
        request_id_counter_c(uint32_t first_id = IPP_REQUEST_ID_MIN);
        ~request_id_counter_c();

        uint32_t next();
    };

    /* Sends requests over a transport.  Transport and counter are owned by the caller and must outlive the client. */
    class ipp_client_c
    {
      private:
        transport_c          *transport;
        request_id_counter_c *request_ids;
        ipp_parse_config_s    parse_config;

      public:
        ipp_client_c(transport_c *transport, request_id_counter_c *request_ids, const ipp_parse_config_s *parse_config = nullptr);

        /* Assigns the next request id to request, sends it, and parses the response.
            Returns IPPO_ERROR_REQUEST_ID_MISMATCH if the response does not echo the request id.
            A non-successful IPP status is not an error here; check ipp_status_is_successful(). */
        ippo_error_e execute(ipp_message_c *request, ipp_message_c *response);
    };
  }
}

#endif /* __IPP_CLIENT_HPP__ */
