#ifndef SCEAU_ISSUANCE_VERIFY_HH
# define SCEAU_ISSUANCE_VERIFY_HH

# include <sceau/derivation/Address.hh>

namespace sceau
{
  namespace issuance
  {
    /// Whether the presented address is the metadata address of the mint
    /// under the registry program.
    ///
    /// Pure: nothing is read or written.
    bool
    metadata_account_valid(derivation::Address const& presented,
                           derivation::Address const& registry_program,
                           derivation::Address const& mint);
    /// Throw InvalidMetadataAccount unless metadata_account_valid().
    void
    check_metadata_account(derivation::Address const& presented,
                           derivation::Address const& registry_program,
                           derivation::Address const& mint);
  }
}

#endif
