#include <gtest/gtest.h>
#include <pthread.h>
#include <set>
#include <vector>

#include "ipp_client.hpp"
#include "ipp_operation.hpp"

using namespace sandor_laboratories::ippo;

/* Answers every request with successful-ok, echoing the request id unless told otherwise */
class fake_transport_c : public transport_c
{
  public:
    ippo_error_e   send_result = IPPO_ERROR_NONE;
    bool           echo_request_id = true;
    bool           garbage_response = false;
    uint32_t       response_request_id = 0;
    octet_buffer_t last_request;
    unsigned int   send_count = 0;

    ippo_error_e send(const octet_buffer_t &request, octet_buffer_t *response) override
    {
      ipp_message_c parsed_request;
      ipp_message_c reply;

      send_count++;
      last_request = request;
      if(IPPO_ERROR_NONE != send_result)
      {
        return send_result;
      }
      if(garbage_response)
      {
        *response = {0x01, 0x01, 0x00};
        return IPPO_ERROR_NONE;
      }

      EXPECT_EQ(IPPO_ERROR_NONE, parse_ipp_message(request, &parsed_request));
      reply = ipp_message_c(IPP_STATUS_SUCCESSFUL_OK,
                            (echo_request_id?parsed_request.get_request_id():response_request_id));
      reply.add_attribute(IPP_TAG_OPERATION_ATTRIBUTES, "attributes-charset", make_ipp_string(IPP_TAG_CHARSET, "utf-8"));
      reply.add_attribute(IPP_TAG_PRINTER_ATTRIBUTES, "printer-state", make_ipp_enum(3));

      response->clear();
      return serialize_ipp_message(&reply, response);
    }
};

class ipp_client_test : public ::testing::Test
{
  protected:
    fake_transport_c     transport;
    ipp_request_params_s params;
    ipp_message_c        request;
    ipp_message_c        response;

    void SetUp() override
    {
      init_ipp_request_params(&params);
      params.printer_uri = "ipp://printer.local/ipp/print";
      ASSERT_TRUE(build_get_printer_attributes_request(&request, IPP_REQUEST_ID_MIN, &params));
    }
};

TEST(request_id_counter, starts_at_one_and_increments)
{
  request_id_counter_c counter;

  EXPECT_EQ(1u, counter.next());
  EXPECT_EQ(2u, counter.next());
  EXPECT_EQ(3u, counter.next());
}

TEST(request_id_counter, wraps_after_maximum)
{
  request_id_counter_c counter(IPP_REQUEST_ID_MAX - 1);

  EXPECT_EQ((uint32_t) IPP_REQUEST_ID_MAX - 1, counter.next());
  EXPECT_EQ((uint32_t) IPP_REQUEST_ID_MAX,     counter.next());
  EXPECT_EQ(1u, counter.next());
}

TEST(request_id_counter, out_of_range_start)
{
  request_id_counter_c zero(0);
  request_id_counter_c high(0x80000000);

  EXPECT_EQ(1u, zero.next());
  EXPECT_EQ(1u, high.next());
}

#define COUNTER_THREADS        4
#define IDS_PER_COUNTER_THREAD 1000

typedef struct
{
  request_id_counter_c *counter;
  std::vector<uint32_t> ids;
} counter_thread_args_s;

static void *counter_thread_f(void *arg)
{
  counter_thread_args_s *args = (counter_thread_args_s *) arg;

  for(unsigned int i = 0; i < IDS_PER_COUNTER_THREAD; i++)
  {
    args->ids.push_back(args->counter->next());
  }

  return nullptr;
}

TEST(request_id_counter, unique_across_threads)
{
  request_id_counter_c  counter;
  pthread_t             threads[COUNTER_THREADS];
  counter_thread_args_s args[COUNTER_THREADS];
  std::set<uint32_t>    ids;

  for(unsigned int i = 0; i < COUNTER_THREADS; i++)
  {
    args[i].counter = &counter;
    ASSERT_EQ(0, pthread_create(&threads[i], nullptr, counter_thread_f, &args[i]));
  }
  for(unsigned int i = 0; i < COUNTER_THREADS; i++)
  {
    ASSERT_EQ(0, pthread_join(threads[i], nullptr));
    ids.insert(args[i].ids.begin(), args[i].ids.end());
  }

  EXPECT_EQ((size_t) (COUNTER_THREADS * IDS_PER_COUNTER_THREAD), ids.size());
  EXPECT_EQ(1u, *ids.begin());
  EXPECT_EQ((uint32_t) (COUNTER_THREADS * IDS_PER_COUNTER_THREAD), *ids.rbegin());
}

TEST_F(ipp_client_test, assigns_request_ids_in_order)
{
  request_id_counter_c counter(41);
  ipp_client_c         client(&transport, &counter);

  ASSERT_EQ(IPPO_ERROR_NONE, client.execute(&request, &response));
  EXPECT_EQ(41u, request.get_request_id());
  EXPECT_EQ(41u, response.get_request_id());
  EXPECT_EQ(IPP_STATUS_SUCCESSFUL_OK, response.get_code());
  EXPECT_NE(nullptr, response.get_attribute(IPP_TAG_PRINTER_ATTRIBUTES, "printer-state"));

  ASSERT_EQ(IPPO_ERROR_NONE, client.execute(&request, &response));
  EXPECT_EQ(42u, response.get_request_id());
  EXPECT_EQ(2u, transport.send_count);

  /* Request id is bytes 4..7 of the request */
  EXPECT_EQ(42, transport.last_request[7]);
}

TEST_F(ipp_client_test, mismatched_request_id)
{
  request_id_counter_c counter;
  ipp_client_c         client(&transport, &counter);

  transport.echo_request_id     = false;
  transport.response_request_id = 99;

  EXPECT_EQ(IPPO_ERROR_REQUEST_ID_MISMATCH, client.execute(&request, &response));
  EXPECT_TRUE(response.get_groups().empty());
}

TEST_F(ipp_client_test, transport_failure_propagates)
{
  request_id_counter_c counter;
  ipp_client_c         client(&transport, &counter);

  transport.send_result = IPPO_ERROR_TRANSPORT;
  EXPECT_EQ(IPPO_ERROR_TRANSPORT, client.execute(&request, &response));
}

TEST_F(ipp_client_test, unparseable_response)
{
  request_id_counter_c counter;
  ipp_client_c         client(&transport, &counter);

  transport.garbage_response = true;
  EXPECT_EQ(IPPO_ERROR_MALFORMED_HEADER, client.execute(&request, &response));
}

TEST_F(ipp_client_test, serialization_failure_skips_send)
{
  request_id_counter_c counter;
  ipp_client_c         client(&transport, &counter);

  request.add_attribute(IPP_TAG_OPERATION_ATTRIBUTES, "bogus", make_ipp_out_of_band(IPP_TAG_END_COLLECTION));
  EXPECT_EQ(IPPO_ERROR_MALFORMED_VALUE, client.execute(&request, &response));
  EXPECT_EQ(0u, transport.send_count);
}

TEST(ipp_client, null_inputs)
{
  ipp_message_c request, response;
  ipp_client_c  client(nullptr, nullptr);

  EXPECT_EQ(IPPO_ERROR_INVALID_ARGUMENT, client.execute(&request, &response));
}
