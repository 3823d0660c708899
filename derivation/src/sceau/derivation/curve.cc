#include <memory>

#include <openssl/bn.h>

#include <elle/log.hh>
#include <elle/printf.hh>

#include <sceau/Exception.hh>
#include <sceau/derivation/Address.hh>
#include <sceau/derivation/curve.hh>

ELLE_LOG_COMPONENT("sceau.derivation.curve");

namespace sceau
{
  namespace derivation
  {
    namespace curve
    {
      typedef std::unique_ptr<BIGNUM, decltype(&::BN_free)> Number;
      typedef std::unique_ptr<BN_CTX, decltype(&::BN_CTX_free)> Context;

      static
      Number
      _number()
      {
        Number res(::BN_new(), &::BN_free);
        if (res == nullptr)
          throw Exception("unable to allocate a big number");
        return res;
      }

      static
      void
      _check(int status, char const* operation)
      {
        if (status != 1)
          throw Exception(elle::sprintf("unable to compute %s", operation));
      }

      namespace
      {
        /// The field modulus, (p - 1) / 2 and the twisted Edwards d
        /// coefficient, -121665 / 121666.
        struct Field
        {
          Field():
            p(_number()),
            half(_number()),
            d(_number())
          {
            Context ctx(::BN_CTX_new(), &::BN_CTX_free);
            if (ctx == nullptr)
              throw Exception("unable to allocate a big number context");
            _check(::BN_set_word(this->p.get(), 1), "p");
            _check(::BN_lshift(this->p.get(), this->p.get(), 255), "p");
            _check(::BN_sub_word(this->p.get(), 19), "p");
            _check(::BN_rshift1(this->half.get(), this->p.get()), "(p - 1) / 2");
            Number numerator = _number();
            Number denominator = _number();
            _check(::BN_set_word(numerator.get(), 121665), "d");
            _check(::BN_sub(numerator.get(), this->p.get(), numerator.get()),
                   "d");
            _check(::BN_set_word(denominator.get(), 121666), "d");
            if (::BN_mod_inverse(denominator.get(), denominator.get(),
                                 this->p.get(), ctx.get()) == nullptr)
              throw Exception("unable to compute d");
            _check(::BN_mod_mul(this->d.get(), numerator.get(),
                                denominator.get(), this->p.get(), ctx.get()),
                   "d");
          }

          Number p;
          Number half;
          Number d;
        };
      }

      static
      Field const&
      _field()
      {
        static Field const field;
        return field;
      }

      bool
      on_curve(Address const& address)
      {
        Field const& field = _field();
        Context ctx(::BN_CTX_new(), &::BN_CTX_free);
        if (ctx == nullptr)
          throw Exception("unable to allocate a big number context");
        // Little-endian y with the x sign bit cleared.
        Address::Value y_bytes = address.value();
        y_bytes[Address::size - 1] &= 0x7f;
        Number y = _number();
        if (::BN_lebin2bn(y_bytes.data(), y_bytes.size(), y.get()) == nullptr)
          throw Exception("unable to load the y coordinate");
        _check(::BN_nnmod(y.get(), y.get(), field.p.get(), ctx.get()), "y");
        Number y2 = _number();
        _check(::BN_mod_sqr(y2.get(), y.get(), field.p.get(), ctx.get()),
               "y^2");
        // u = y^2 - 1
        Number u = _number();
        if (::BN_copy(u.get(), y2.get()) == nullptr)
          throw Exception("unable to compute u");
        _check(::BN_sub_word(u.get(), 1), "u");
        _check(::BN_nnmod(u.get(), u.get(), field.p.get(), ctx.get()), "u");
        if (::BN_is_zero(u.get()))
        {
          ELLE_DUMP("%s: x = 0", address);
          return true;
        }
        // v = d y^2 + 1, never zero since -1 / d is not a square.
        Number v = _number();
        _check(::BN_mod_mul(v.get(), field.d.get(), y2.get(),
                            field.p.get(), ctx.get()),
               "v");
        _check(::BN_add_word(v.get(), 1), "v");
        _check(::BN_nnmod(v.get(), v.get(), field.p.get(), ctx.get()), "v");
        if (::BN_mod_inverse(v.get(), v.get(),
                             field.p.get(), ctx.get()) == nullptr)
          throw Exception("unable to invert v");
        Number x2 = _number();
        _check(::BN_mod_mul(x2.get(), u.get(), v.get(),
                            field.p.get(), ctx.get()),
               "x^2");
        // Euler's criterion.
        Number legendre = _number();
        _check(::BN_mod_exp(legendre.get(), x2.get(), field.half.get(),
                            field.p.get(), ctx.get()),
               "legendre symbol");
        bool res = ::BN_is_one(legendre.get());
        ELLE_DUMP("%s: %s", address, res ? "on curve" : "off curve");
        return res;
      }
    }
  }
}
