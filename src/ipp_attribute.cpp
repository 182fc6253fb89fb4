#include <cstdio>

#include "ipp_attribute.hpp"

using namespace sandor_laboratories::ippo;

ipp_attribute_group_c::ipp_attribute_group_c(ipp_tag_t tag)
  : tag(tag), last_position(0)
{
}

bool ipp_attribute_group_c::add_attribute(const std::string &name, const ipp_value_list_t &values)
{
  bool ret_val = true;
  std::map<std::string, size_t>::const_iterator it;

  if(name.empty() || values.empty())
  {
    fprintf(stderr, "Invalid attribute for %s group.  name '%s' values %zu\n",
            ipp_tag_string(tag), name.c_str(), values.size());
    ret_val = false;
  }
  else
  {
    it = attribute_index.find(name);
    if(attribute_index.end() == it)
    {
      const ipp_attribute_s attribute = 
        {
          .name   = name,
          .values = values,
        };
      last_position = attributes.size();
      attribute_index[name] = last_position;
      attributes.push_back(attribute);
    }
    else
    {
      last_position = it->second;
      ipp_value_list_t *existing_values = &attributes[last_position].values;
      existing_values->insert(existing_values->end(), values.begin(), values.end());
    }
  }

  return ret_val;
}

bool ipp_attribute_group_c::add_attribute(const std::string &name, const ipp_value_s &value)
{
  return add_attribute(name, ipp_value_list_t(1, value));
}

bool ipp_attribute_group_c::append_to_last_attribute(const ipp_value_s &value)
{
  bool ret_val = false;

  if(!attributes.empty())
  {
    attributes[last_position].values.push_back(value);
    ret_val = true;
  }
  else
  {
    fprintf(stderr, "No attribute in %s group to append value to.\n", ipp_tag_string(tag));
  }

  return ret_val;
}

const ipp_attribute_s *ipp_attribute_group_c::get_attribute(const std::string &name) const
{
  const ipp_attribute_s *ret_ptr = nullptr;
  std::map<std::string, size_t>::const_iterator it = attribute_index.find(name);

  if(attribute_index.end() != it)
  {
    ret_ptr = &attributes[it->second];
  }

  return ret_ptr;
}

const ipp_attribute_s *ipp_attribute_group_c::get_last_attribute() const
{
  return (attributes.empty()?nullptr:&attributes[last_position]);
}

bool sandor_laboratories::ippo::ipp_attribute_group_equal(const ipp_attribute_group_c *a, const ipp_attribute_group_c *b)
{
  bool ret_val = false;

  if((a != nullptr) && (b != nullptr))
  {
    ret_val = ((a->get_tag() == b->get_tag()) && (a->size() == b->size()));
    for(size_t i = 0; ret_val && (i < a->size()); i++)
    {
      ret_val = ipp_attribute_equal(&a->get_attributes()[i], &b->get_attributes()[i]);
    }
  }
  else
  {
    ret_val = (a == b);
  }

  return ret_val;
}
