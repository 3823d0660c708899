#include <elle/log.hh>

#include <sceau/derivation/InvalidSeeds.hh>
#include <sceau/derivation/Proof.hh>
#include <sceau/derivation/derive.hh>

ELLE_LOG_COMPONENT("sceau.derivation.Proof");

namespace sceau
{
  namespace derivation
  {
    /*-------------.
    | Construction |
    `-------------*/

    Proof::Proof(Seeds seeds,
                 Nonce nonce,
                 Address program,
                 Address address):
      _seeds(std::move(seeds)),
      _nonce(nonce),
      _program(std::move(program)),
      _address(std::move(address))
    {}

    /*--------.
    | Methods |
    `--------*/

    Seeds
    Proof::signer_seeds() const
    {
      Seeds res(this->_seeds);
      res.push_back(std::string(1, static_cast<char>(this->_nonce)));
      return res;
    }

    bool
    Proof::verify() const
    {
      ELLE_TRACE_SCOPE("%s: verify", *this);
      try
      {
        return create(this->signer_seeds(), this->_program) == this->_address;
      }
      catch (InvalidSeeds const& e)
      {
        ELLE_WARN("%s: %s", *this, e.what());
        return false;
      }
    }

    bool
    Proof::authorizes(Address const& address) const
    {
      return this->_address == address && this->verify();
    }

    /*----------.
    | Printable |
    `----------*/

    void
    Proof::print(std::ostream& stream) const
    {
      stream << "Proof(" << this->_address
             << ", nonce " << static_cast<unsigned int>(this->_nonce) << ")";
    }
  }
}
