#ifndef SCEAU_ISSUANCE_ORCHESTRATOR_HH
# define SCEAU_ISSUANCE_ORCHESTRATOR_HH

# include <string>

# include <elle/Printable.hh>
# include <elle/attribute.hh>

# include <sceau/derivation/Address.hh>
# include <sceau/issuance/Accounts.hh>
# include <sceau/issuance/State.hh>
# include <sceau/ledger/Ledger.hh>
# include <sceau/registry/Registry.hh>

namespace sceau
{
  namespace issuance
  {
    /// Issue the single unit of a resource and attach its metadata.
    ///
    /// The orchestrator holds no key: the mint authority is an address
    /// derived from the identifier, and its derivation proof is the only
    /// authorization ever presented to the collaborators.  It does not
    /// roll anything back either; run it over a journal (see Host) to get
    /// all-or-nothing semantics.
    class Orchestrator:
      public elle::Printable
    {
    /*-------------.
    | Construction |
    `-------------*/
    public:
      Orchestrator(derivation::Address program,
                   ledger::Ledger& ledger,
                   registry::Registry& registry,
                   std::string symbol = "PLANET");
      ELLE_ATTRIBUTE_R(derivation::Address, program);
      ELLE_ATTRIBUTE_RX(ledger::Ledger&, ledger);
      ELLE_ATTRIBUTE_RX(registry::Registry&, registry);
      ELLE_ATTRIBUTE_R(std::string, symbol);
      ELLE_ATTRIBUTE_R(State, state);

    /*-----------.
    | Operations |
    `-----------*/
    public:
      /// Mint the resource named by the identifier to the owner.
      ///
      /// Throw AuthorizationError if a presented derived address or the
      /// registry program is wrong, IssuanceError if the identifier was
      /// already issued, InvalidMetadataAccount if the presented metadata
      /// address is not the one of the mint.  Collaborator errors go
      /// through untouched.  Any error leaves the state aborted.
      void
      mint(Accounts const& accounts,
           std::string const& identifier,
           std::string const& name,
           std::string const& uri);

    private:
      void
      _check(Accounts const& accounts,
             std::string const& identifier) const;

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
