#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <elle/Exception.hh>
#include <elle/log.hh>
#include <elle/log/TextLogger.hh>
#include <elle/printf.hh>

#include <satellites/satellite.hh>

ELLE_LOG_COMPONENT("sceau.satellite");

static
std::ostream&
log_destination()
{
  if (auto env = ::getenv("SCEAU_LOG_FILE"))
    {
      static std::ofstream res(env, std::fstream::trunc | std::fstream::out);
      return res;
    }
  else
    return std::cerr;
}

namespace sceau
{
  Exit::Exit(int value):
    elle::Exception(elle::sprintf("exit with status %s", value)),
    _value(value)
  {}

  int
  satellite_main(std::string const& name, std::function<void ()> const& action)
  {
    elle::log::logger
      (std::unique_ptr<elle::log::Logger>
       (new elle::log::TextLogger(log_destination())));

    ELLE_TRACE_SCOPE("%s: start", name);
    try
    {
      action();
      ELLE_DEBUG("quiting %s", name);
      return 0;
    }
    catch (Exit const& e)
    {
      return e.value();
    }
    catch (elle::Exception const& e)
    {
      ELLE_ERR("%s: fatal error: %s", name, e);
      std::cerr << name << ": fatal error: " << e.what() << std::endl;
      return 1;
    }
    catch (std::runtime_error const& e)
    {
      ELLE_ERR("%s: fatal error: %s", name, e.what());
      std::cerr << name << ": fatal error: " << e.what() << std::endl;
      return 1;
    }
    catch (std::exception const& e)
    {
      ELLE_ERR("%s: unexpected error: %s", name, e.what());
      std::cerr << name << ": unexpected error: " << e.what() << std::endl;
      return 1;
    }
  }
}
