// framework/dto/tag_invoke.hpp
#ifndef ROUTEKIT_FRAMEWORK_DTO_TAG_INVOKE_HPP
#define ROUTEKIT_FRAMEWORK_DTO_TAG_INVOKE_HPP

#include <boost/describe.hpp>
#include <boost/json.hpp>
#include <boost/mp11.hpp>
#include <type_traits>

// JSON conversion for any struct described with BOOST_DESCRIBE_STRUCT.
// Only described public members take part; anything else keeps its default.
namespace boost::json
{
  namespace desc = boost::describe;
  namespace mp11 = boost::mp11;

  template <class T>
  auto tag_invoke(value_from_tag, value& jv, T const& t)
    -> std::enable_if_t<desc::has_describe_members<T>::value>
  {
    auto& obj = jv.emplace_object();

    using Md = desc::describe_members<T, desc::mod_public>;
    mp11::mp_for_each<Md>([&](auto D)
    {
      obj.emplace(D.name, value_from(t.*D.pointer));
    });
  }

  // Keys missing from the object keep the member's default initializer; unknown keys are ignored.
  // Throws if jv is not an object or a member has the wrong JSON type.
  template <class T>
  auto tag_invoke(value_to_tag<T>, value const& jv)
    -> std::enable_if_t<desc::has_describe_members<T>::value, T>
  {
    T t{};
    auto const& obj = jv.as_object();

    using Md = desc::describe_members<T, desc::mod_public>;
    mp11::mp_for_each<Md>([&](auto D)
    {
      if (auto it = obj.find(D.name); it != obj.end())
      {
        using MemberT = std::remove_reference_t<decltype(t.*D.pointer)>;
        t.*D.pointer = value_to<MemberT>(it->value());
      }
    });

    return t;
  }
} // namespace boost::json

#endif // ROUTEKIT_FRAMEWORK_DTO_TAG_INVOKE_HPP
