#include <algorithm>
#include <cstring>

#include <boost/functional/hash.hpp>

#include <elle/printf.hh>

#include <sceau/derivation/Address.hh>
#include <sceau/derivation/InvalidAddress.hh>
#include <sceau/derivation/base58.hh>

namespace sceau
{
  namespace derivation
  {
    std::size_t const Address::size;

    /*-------------.
    | Construction |
    `-------------*/

    Address::Address():
      _value()
    {
      this->_value.fill(0);
    }

    Address::Address(Value const& value):
      _value(value)
    {}

    Address::Address(elle::Buffer const& bytes):
      _value()
    {
      if (bytes.size() != Address::size)
        throw InvalidAddress(
          base58::encode(bytes.contents(), bytes.size()),
          elle::sprintf("%s bytes instead of %s", bytes.size(), Address::size));
      std::memcpy(this->_value.data(), bytes.contents(), Address::size);
    }

    Address::Address(elle::serialization::SerializerIn& s):
      _value()
    {
      this->serialize(s);
    }

    Address
    Address::from_string(std::string const& representation)
    {
      elle::Buffer bytes = base58::decode(representation);
      if (bytes.size() != Address::size)
        throw InvalidAddress(
          representation,
          elle::sprintf("%s bytes instead of %s", bytes.size(), Address::size));
      return Address(bytes);
    }

    /*----------.
    | Operators |
    `----------*/

    bool
    Address::operator ==(Address const& other) const
    {
      return this->_value == other._value;
    }

    bool
    Address::operator !=(Address const& other) const
    {
      return !(*this == other);
    }

    bool
    Address::operator <(Address const& other) const
    {
      return this->_value < other._value;
    }

    /*--------.
    | Methods |
    `--------*/

    std::string
    Address::string() const
    {
      return base58::encode(this->_value.data(), this->_value.size());
    }

    /*--------------.
    | Serialization |
    `--------------*/

    void
    Address::serialize(elle::serialization::Serializer& s)
    {
      std::string representation;
      if (s.out())
        representation = this->string();
      s.serialize("base58", representation);
      if (s.in())
        *this = Address::from_string(representation);
    }

    /*----------.
    | Printable |
    `----------*/

    void
    Address::print(std::ostream& stream) const
    {
      stream << this->string();
    }
  }
}

namespace std
{
  std::size_t
  hash<sceau::derivation::Address>::operator()(
    sceau::derivation::Address const& address) const
  {
    return boost::hash_range(address.value().begin(), address.value().end());
  }
}
