#ifndef SCEAU_ISSUANCE_ACCOUNTS_HH
# define SCEAU_ISSUANCE_ACCOUNTS_HH

# include <string>

# include <elle/Printable.hh>

# include <sceau/derivation/Address.hh>
# include <sceau/issuance/Configuration.hh>

namespace sceau
{
  namespace issuance
  {
    /// The addresses a caller presents along with a mint instruction.
    ///
    /// Nothing here is trusted: the orchestrator recomputes every derived
    /// address before acting.
    struct Accounts:
      public elle::Printable
    {
    public:
      derivation::Address owner;
      derivation::Address mint;
      derivation::Address mint_authority;
      derivation::Address holding;
      derivation::Address metadata;
      derivation::Address registry_program;

    public:
      /// The accounts an honest caller presents for an identifier.
      static
      Accounts
      derive(std::string const& identifier,
             derivation::Address const& owner,
             Configuration const& configuration);

    public:
      void
      print(std::ostream& stream) const override;
    };
  }
}

#endif
