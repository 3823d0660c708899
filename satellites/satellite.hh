#ifndef SCEAU_SATELLITE_HH
# define SCEAU_SATELLITE_HH

# include <functional>
# include <string>

# include <elle/Exception.hh>
# include <elle/attribute.hh>

namespace sceau
{
  /// Leave a satellite early with the given status.
  class Exit:
    public elle::Exception
  {
  public:
    Exit(int value);

  private:
    ELLE_ATTRIBUTE_R(int, value);
  };

  /// Set up logging, run the action and turn its errors into a status.
  int
  satellite_main(std::string const& name, std::function<void ()> const& action);
}

#endif
