#ifndef SCEAU_STORAGE_JSON_HXX
# define SCEAU_STORAGE_JSON_HXX

# include <sstream>
# include <string>

# include <elle/serialization/json.hh>

namespace sceau
{
  namespace storage
  {
    namespace json
    {
      template <typename T>
      elle::Buffer
      encode(T const& record)
      {
        // serialize() is shared with deserialization and thus not const.
        T copy(record);
        std::stringstream stream;
        {
          elle::serialization::json::SerializerOut output(stream, false);
          copy.serialize(output);
        }
        std::string const content = stream.str();
        return elle::Buffer(content.data(), content.size());
      }

      template <typename T>
      T
      decode(elle::Buffer const& data)
      {
        std::stringstream stream(
          std::string(reinterpret_cast<char const*>(data.contents()),
                      data.size()));
        elle::serialization::json::SerializerIn input(stream, false);
        return T(input);
      }
    }
  }
}

#endif
