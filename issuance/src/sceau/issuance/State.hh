#ifndef SCEAU_ISSUANCE_STATE_HH
# define SCEAU_ISSUANCE_STATE_HH

# include <iosfwd>

namespace sceau
{
  namespace issuance
  {
    /// Progress of the issuance of one identifier.
    enum class State
    {
      unissued,
      authorized,
      issued,
      metadata_attached,
      aborted,
    };

    std::ostream&
    operator <<(std::ostream& out, State state);
  }
}

#endif
