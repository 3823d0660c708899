#ifndef SCEAU_DERIVATION_CURVE_HH
# define SCEAU_DERIVATION_CURVE_HH

# include <sceau/derivation/fwd.hh>

namespace sceau
{
  namespace derivation
  {
    namespace curve
    {
      /// Whether the address decompresses to a point of the Ed25519
      /// curve, i.e. whether a private key could exist for it.
      ///
      /// The sign bit is ignored and the y coordinate is reduced modulo
      /// 2^255 - 19: the address is on the curve iff (y^2 - 1) / (d y^2 + 1)
      /// is a square.
      bool
      on_curve(Address const& address);
    }
  }
}

#endif
