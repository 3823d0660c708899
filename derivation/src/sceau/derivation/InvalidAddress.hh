#ifndef SCEAU_DERIVATION_INVALIDADDRESS_HH
# define SCEAU_DERIVATION_INVALIDADDRESS_HH

# include <sceau/Exception.hh>

namespace sceau
{
  namespace derivation
  {
    class InvalidAddress:
      public Exception
    {
    public:
      InvalidAddress(elle::String const& representation,
                     elle::String const& reason);
    };
  }
}

#endif
