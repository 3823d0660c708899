#include <sceau/InvalidMetadataAccount.hh>

namespace sceau
{
  InvalidMetadataAccount::InvalidMetadataAccount():
    Exception("invalid metadata account")
  {}
}
