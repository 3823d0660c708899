#ifndef SCEAU_DERIVATION_ADDRESS_HH
# define SCEAU_DERIVATION_ADDRESS_HH

# include <array>
# include <functional>
# include <string>

# include <elle/Buffer.hh>
# include <elle/Printable.hh>
# include <elle/attribute.hh>
# include <elle/serialization/Serializer.hh>

namespace sceau
{
  namespace derivation
  {
    /// A 32-byte account location, either a program id, an owner key or
    /// the output of a derivation.
    ///
    /// Addresses are printed and parsed in base58.
    class Address:
      public elle::Printable
    {
    /*------.
    | Types |
    `------*/
    public:
      static std::size_t const size = 32;
      typedef std::array<unsigned char, 32> Value;

    /*-------------.
    | Construction |
    `-------------*/
    public:
      /// The all-zero address.
      Address();
      explicit
      Address(Value const& value);
      /// Throw InvalidAddress unless exactly 32 bytes are given.
      explicit
      Address(elle::Buffer const& bytes);
      Address(elle::serialization::SerializerIn& s);
      /// Parse a base58 representation.
      static
      Address
      from_string(std::string const& representation);
      ELLE_ATTRIBUTE_R(Value, value);

    /*----------.
    | Operators |
    `----------*/
    public:
      bool
      operator ==(Address const& other) const;
      bool
      operator !=(Address const& other) const;
      bool
      operator <(Address const& other) const;

    /*--------.
    | Methods |
    `--------*/
    public:
      /// The base58 representation.
      std::string
      string() const;

    /*--------------.
    | Serialization |
    `--------------*/
    public:
      void
      serialize(elle::serialization::Serializer& s);

    /*----------.
    | Printable |
    `----------*/
    public:
      void
      print(std::ostream& stream) const override;
    };
  }
}

namespace std
{
  template<>
  struct hash<sceau::derivation::Address>
  {
  public:
    std::size_t
    operator()(sceau::derivation::Address const& address) const;
  };
}

#endif
