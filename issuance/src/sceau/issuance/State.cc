#include <ostream>

#include <sceau/issuance/State.hh>

namespace sceau
{
  namespace issuance
  {
    std::ostream&
    operator <<(std::ostream& out, State state)
    {
      switch (state)
      {
        case State::unissued:
          return out << "unissued";
        case State::authorized:
          return out << "authorized";
        case State::issued:
          return out << "issued";
        case State::metadata_attached:
          return out << "metadata attached";
        case State::aborted:
          return out << "aborted";
      }
      return out << "unknown state";
    }
  }
}
