#ifndef SCEAU_LEDGER_LEDGER_HH
# define SCEAU_LEDGER_LEDGER_HH

# include <cstdint>

# include <elle/Printable.hh>
# include <elle/attribute.hh>

# include <sceau/derivation/Address.hh>
# include <sceau/derivation/Proof.hh>
# include <sceau/ledger/Holding.hh>
# include <sceau/ledger/Mint.hh>
# include <sceau/storage/Storage.hh>

namespace sceau
{
  namespace ledger
  {
    /// The ledger service: mints and the holdings of their units.
    ///
    /// Records live in the given storage, each at its own address.  No
    /// private key is involved: issuing units requires a derivation proof
    /// for the mint authority.
    class Ledger:
      public elle::Printable
    {
    /*------.
    | Types |
    `------*/
    public:
      typedef derivation::Address Address;

    /*-------------.
    | Construction |
    `-------------*/
    public:
      /// @param program The ledger program id, part of holding derivations.
      /// @param associated_program The program holding addresses are
      ///                           derived under.
      Ledger(storage::Storage& storage,
             Address program,
             Address associated_program);
      ELLE_ATTRIBUTE_RX(storage::Storage&, storage);
      ELLE_ATTRIBUTE_R(Address, program);
      ELLE_ATTRIBUTE_R(Address, associated_program);

    /*-----------.
    | Operations |
    `-----------*/
    public:
      /// Create a mint with no supply.
      ///
      /// Throw IssuanceError if the address is taken.
      void
      create_mint(Address const& address,
                  int decimals,
                  Address const& authority);
      /// Where the holding of a mint's units by an owner lives.
      Address
      holding_address(Address const& owner,
                      Address const& mint) const;
      static
      Address
      holding_address(Address const& owner,
                      Address const& mint,
                      Address const& program,
                      Address const& associated_program);
      /// Create the empty holding of the owner for the mint.
      ///
      /// Throw IssuanceError if the mint is missing or the holding exists.
      Address
      create_holding_account(Address const& owner,
                             Address const& mint);
      /// Issue units of the mint into the holding.
      ///
      /// Throw AuthorizationError unless the proof stands for the mint
      /// authority, IssuanceError if the accounts are missing or
      /// inconsistent or if the supply would overflow.
      void
      mint_to(Address const& mint,
              Address const& holding,
              derivation::Proof const& authority,
              uint64_t amount);

    /*--------.
    | Queries |
    `--------*/
    public:
      /// Throw IssuanceError if there is no mint at the address.
      Mint
      mint(Address const& address) const;
      /// Throw IssuanceError if there is no holding at the address.
      Holding
      holding(Address const& address) const;

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
