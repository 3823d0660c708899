#ifndef SCEAU_STORAGE_MISSING_HH
# define SCEAU_STORAGE_MISSING_HH

# include <sceau/Exception.hh>
# include <sceau/derivation/Address.hh>

namespace sceau
{
  namespace storage
  {
    /// The address holds no record.
    class Missing:
      public Exception
    {
    public:
      Missing(derivation::Address const& address);
      ELLE_ATTRIBUTE_R(derivation::Address, address);
    };
  }
}

#endif
