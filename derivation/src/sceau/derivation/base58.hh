#ifndef SCEAU_DERIVATION_BASE58_HH
# define SCEAU_DERIVATION_BASE58_HH

# include <cstddef>
# include <string>

# include <elle/Buffer.hh>

namespace sceau
{
  namespace derivation
  {
    /// Base58 with the Bitcoin alphabet, the textual form of addresses.
    namespace base58
    {
      std::string
      encode(unsigned char const* data,
             std::size_t size);
      /// Throw InvalidAddress on characters outside the alphabet.
      elle::Buffer
      decode(std::string const& representation);
    }
  }
}

#endif
