#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <utility>

#include "ipp_client.hpp"

using namespace sandor_laboratories::ippo;

request_id_counter_c::request_id_counter_c(uint32_t first_id)
  : next_id(((first_id >= IPP_REQUEST_ID_MIN) && (first_id <= IPP_REQUEST_ID_MAX))?first_id:IPP_REQUEST_ID_MIN)
{
}

request_id_counter_c::~request_id_counter_c()
{
  pthread_mutex_destroy(&mutex);
}

inline void request_id_counter_c::lock()
{
  int rc = pthread_mutex_lock(&mutex);
  if(0 != rc)
  {
    fprintf(stderr, "Failed to lock request id mutex.  %d: %s\n", rc, strerror(rc));
  }
}

inline void request_id_counter_c::unlock()
{
  int rc = pthread_mutex_unlock(&mutex);
  if(0 != rc)
  {
    fprintf(stderr, "Failed to unlock request id mutex.  %d: %s\n", rc, strerror(rc));
  }
}

uint32_t request_id_counter_c::next()
{
  uint32_t ret_val = 0;

  lock();

  ret_val = next_id;
  next_id = ((next_id >= IPP_REQUEST_ID_MAX)?IPP_REQUEST_ID_MIN:(next_id+1));

  unlock();

  return ret_val;
}

ipp_client_c::ipp_client_c(transport_c *transport, request_id_counter_c *request_ids, const ipp_parse_config_s *parse_config_)
  : transport(transport), request_ids(request_ids)
{
  init_ipp_parse_config(&parse_config);
  if(parse_config_ != nullptr)
  {
    parse_config = *parse_config_;
  }
}

ippo_error_e ipp_client_c::execute(ipp_message_c *request, ipp_message_c *response)
{
  ippo_error_e   ret_val = IPPO_ERROR_NONE;
  octet_buffer_t request_bytes;
  octet_buffer_t response_bytes;
  ipp_message_c  parsed_response;

  if((transport == nullptr) || (request_ids == nullptr) || (request == nullptr) || (response == nullptr))
  {
    fprintf(stderr, "Null inputs to execute IPP request.  transport %p request_ids %p request %p response %p\n",
            (void *) transport, (void *) request_ids, (void *) request, (void *) response);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  request->set_request_id(request_ids->next());

  ret_val = serialize_ipp_message(request, &request_bytes);
  if(IPPO_ERROR_NONE == ret_val)
  {
    ret_val = transport->send(request_bytes, &response_bytes);
  }
  if(IPPO_ERROR_NONE == ret_val)
  {
    ret_val = parse_ipp_message(response_bytes, &parsed_response, &parse_config);
  }
  if((IPPO_ERROR_NONE == ret_val) && (parsed_response.get_request_id() != request->get_request_id()))
  {
    fprintf(stderr, "Response request-id %" PRIu32 " does not match request-id %" PRIu32 ".\n",
            parsed_response.get_request_id(), request->get_request_id());
    ret_val = IPPO_ERROR_REQUEST_ID_MISMATCH;
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    *response = std::move(parsed_response);
  }
  else
  {
    fprintf(stderr, "IPP request-id %" PRIu32 " failed.  %s\n", request->get_request_id(), ippo_error_string(ret_val));
  }

  return ret_val;
}
