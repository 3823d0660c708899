#ifndef SCEAU_INVALIDMETADATAACCOUNT_HH
# define SCEAU_INVALIDMETADATAACCOUNT_HH

# include <sceau/Exception.hh>

namespace sceau
{
  class InvalidMetadataAccount:
    public Exception
  {
  public:
    InvalidMetadataAccount();
  };
}

#endif
