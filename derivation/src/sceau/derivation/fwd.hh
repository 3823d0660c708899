#ifndef SCEAU_DERIVATION_FWD_HH
# define SCEAU_DERIVATION_FWD_HH

# include <cstdint>
# include <string>
# include <vector>

namespace sceau
{
  namespace derivation
  {
    class Address;
    class Proof;

    /// The byte strings an address is derived from, nonce excluded.
    typedef std::vector<std::string> Seeds;
    /// The one-byte seed which pushes a derived address off the curve.
    typedef uint8_t Nonce;
  }
}

#endif
