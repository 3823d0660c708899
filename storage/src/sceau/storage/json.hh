#ifndef SCEAU_STORAGE_JSON_HH
# define SCEAU_STORAGE_JSON_HH

# include <elle/Buffer.hh>

namespace sceau
{
  namespace storage
  {
    /// JSON encoding of the records kept in a storage.
    ///
    /// T must provide serialize(elle::serialization::Serializer&) and a
    /// constructor from elle::serialization::SerializerIn&.
    namespace json
    {
      template <typename T>
      elle::Buffer
      encode(T const& record);
      template <typename T>
      T
      decode(elle::Buffer const& data);
    }
  }
}

# include <sceau/storage/json.hxx>

#endif
