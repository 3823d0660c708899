#ifndef SCEAU_DERIVATION_DERIVE_HH
# define SCEAU_DERIVATION_DERIVE_HH

# include <string>
# include <utility>

# include <sceau/derivation/Address.hh>
# include <sceau/derivation/Proof.hh>
# include <sceau/derivation/fwd.hh>

namespace sceau
{
  namespace derivation
  {
    /*----------.
    | Constants |
    `----------*/

    /// Maximum number of seeds, the nonce included.
    static std::size_t const max_seeds = 16;
    /// Maximum length of a single seed.
    static std::size_t const max_seed_length = 32;
    /// Appended after the program id so that a derived address can never
    /// collide with the hash of some other structure.
    extern std::string const marker;

    /*----------.
    | Functions |
    `----------*/

    /// A seed from the raw bytes of an address.
    std::string
    seed(Address const& address);

    /// Hash the seeds, the program id and the marker into an address.
    ///
    /// The seeds must already include the nonce.  Throw InvalidSeeds when
    /// the limits are exceeded or when the result lies on the curve.
    Address
    create(Seeds const& seeds,
           Address const& program);
    /// The first nonce, counting up from zero, whose address lies off the
    /// curve, together with that address.
    ///
    /// This is pure: the same seeds and program always yield the same
    /// pair.
    std::pair<Address, Nonce>
    find(Seeds const& seeds,
         Address const& program);
    /// Find the address and wrap everything needed to act as it.
    Proof
    prove(Seeds seeds,
          Address const& program);
  }
}

#endif
