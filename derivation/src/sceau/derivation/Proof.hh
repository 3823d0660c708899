#ifndef SCEAU_DERIVATION_PROOF_HH
# define SCEAU_DERIVATION_PROOF_HH

# include <elle/Printable.hh>
# include <elle/attribute.hh>

# include <sceau/derivation/Address.hh>
# include <sceau/derivation/fwd.hh>

namespace sceau
{
  namespace derivation
  {
    /// The seeds, nonce and program an address was derived from.
    ///
    /// Whoever holds a proof may act as its address: collaborators accept
    /// it in place of a signature after recomputing the address.  A proof
    /// is a capability for the invocation which derived it, it can be
    /// moved along but neither copied nor serialized.
    class Proof:
      public elle::Printable
    {
    /*-------------.
    | Construction |
    `-------------*/
    public:
      Proof(Seeds seeds,
            Nonce nonce,
            Address program,
            Address address);
      Proof(Proof&& other) = default;
      Proof(Proof const&) = delete;
      Proof&
      operator =(Proof const&) = delete;
      ELLE_ATTRIBUTE_R(Seeds, seeds);
      ELLE_ATTRIBUTE_R(Nonce, nonce);
      ELLE_ATTRIBUTE_R(Address, program);
      ELLE_ATTRIBUTE_R(Address, address);

    /*--------.
    | Methods |
    `--------*/
    public:
      /// The seeds followed by the nonce.
      Seeds
      signer_seeds() const;
      /// Whether the seeds and nonce really yield the address under the
      /// program.
      bool
      verify() const;
      /// Whether this proof allows acting as the given address.
      bool
      authorizes(Address const& address) const;

    /*----------.
    | Printable |
    `----------*/
    public:
      void
      print(std::ostream& stream) const override;
    };
  }
}

#endif
