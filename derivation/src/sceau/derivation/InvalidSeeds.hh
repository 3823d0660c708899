#ifndef SCEAU_DERIVATION_INVALIDSEEDS_HH
# define SCEAU_DERIVATION_INVALIDSEEDS_HH

# include <sceau/Exception.hh>

namespace sceau
{
  namespace derivation
  {
    /// The seeds cannot produce an admissible derived address.
    class InvalidSeeds:
      public Exception
    {
    public:
      InvalidSeeds(elle::String const& message);
    };
  }
}

#endif
