#include <gtest/gtest.h>

#include "ipp_attribute.hpp"

using namespace sandor_laboratories::ippo;

TEST(ipp_attribute_group, keeps_insertion_order)
{
  ipp_attribute_group_c group(IPP_TAG_PRINTER_ATTRIBUTES);

  ASSERT_TRUE(group.add_attribute("printer-name", make_ipp_string(IPP_TAG_NAME_WITHOUT_LANGUAGE, "office")));
  ASSERT_TRUE(group.add_attribute("copies-default", make_ipp_integer(1)));
  ASSERT_TRUE(group.add_attribute("color-supported", make_ipp_boolean(true)));

  ASSERT_EQ(3u, group.size());
  EXPECT_EQ("printer-name",    group.get_attributes()[0].name);
  EXPECT_EQ("copies-default",  group.get_attributes()[1].name);
  EXPECT_EQ("color-supported", group.get_attributes()[2].name);
  EXPECT_EQ(IPP_TAG_PRINTER_ATTRIBUTES, group.get_tag());
}

TEST(ipp_attribute_group, repeated_name_merges_into_first)
{
  ipp_attribute_group_c group(IPP_TAG_PRINTER_ATTRIBUTES);

  group.add_attribute("sides-supported", make_ipp_string(IPP_TAG_KEYWORD, "one-sided"));
  group.add_attribute("copies-default", make_ipp_integer(1));
  group.add_attribute("sides-supported", make_ipp_string(IPP_TAG_KEYWORD, "two-sided-long-edge"));

  ASSERT_EQ(2u, group.size());
  const ipp_attribute_s *sides = group.get_attribute("sides-supported");
  ASSERT_NE(nullptr, sides);
  ASSERT_EQ(2u, sides->values.size());
  EXPECT_EQ("one-sided",           sides->values[0].text);
  EXPECT_EQ("two-sided-long-edge", sides->values[1].text);
  EXPECT_EQ(sides, group.get_last_attribute());
}

TEST(ipp_attribute_group, continuation_appends_to_latest_add)
{
  ipp_attribute_group_c group(IPP_TAG_OPERATION_ATTRIBUTES);

  EXPECT_FALSE(group.append_to_last_attribute(make_ipp_integer(0)));

  group.add_attribute("requested-attributes", make_ipp_string(IPP_TAG_KEYWORD, "printer-name"));
  group.add_attribute("job-id", make_ipp_integer(7));
  group.add_attribute("requested-attributes", make_ipp_string(IPP_TAG_KEYWORD, "printer-state"));
  ASSERT_TRUE(group.append_to_last_attribute(make_ipp_string(IPP_TAG_KEYWORD, "media-ready")));

  EXPECT_EQ(3u, group.get_attribute("requested-attributes")->values.size());
  EXPECT_EQ(1u, group.get_attribute("job-id")->values.size());
}

TEST(ipp_attribute_group, rejects_empty_name_or_values)
{
  ipp_attribute_group_c group(IPP_TAG_JOB_ATTRIBUTES);

  EXPECT_FALSE(group.add_attribute("", make_ipp_integer(1)));
  EXPECT_FALSE(group.add_attribute("job-id", ipp_value_list_t()));
  EXPECT_TRUE(group.empty());
  EXPECT_EQ(nullptr, group.get_attribute("job-id"));
  EXPECT_EQ(nullptr, group.get_last_attribute());
}

TEST(ipp_attribute_group, equality)
{
  ipp_attribute_group_c a(IPP_TAG_JOB_ATTRIBUTES);
  ipp_attribute_group_c b(IPP_TAG_JOB_ATTRIBUTES);
  ipp_attribute_group_c c(IPP_TAG_PRINTER_ATTRIBUTES);

  a.add_attribute("job-id", make_ipp_integer(3));
  b.add_attribute("job-id", make_ipp_integer(3));
  c.add_attribute("job-id", make_ipp_integer(3));

  EXPECT_TRUE (ipp_attribute_group_equal(&a, &b));
  EXPECT_FALSE(ipp_attribute_group_equal(&a, &c));

  b.add_attribute("job-state", make_ipp_enum(3));
  EXPECT_FALSE(ipp_attribute_group_equal(&a, &b));
}
