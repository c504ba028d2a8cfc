#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace vg::core {

template <typename value_t> class result;

template <typename t>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<t>>;

template <typename t>
concept default_initializable_object =
    std::default_initializable<remove_cvref_t<t>>;

template <typename t> struct is_optional : std::false_type {};

template <typename value_t>
struct is_optional<std::optional<value_t>> : std::true_type {};

template <typename t>
inline constexpr bool is_optional_v = is_optional<remove_cvref_t<t>>::value;

template <typename t> struct is_result : std::false_type {};

template <typename value_t>
struct is_result<result<value_t>> : std::true_type {};

template <typename t>
inline constexpr bool is_result_v = is_result<remove_cvref_t<t>>::value;

template <typename... ts> struct type_list {};

template <typename list_t> struct type_list_size;

template <typename... ts>
struct type_list_size<type_list<ts...>>
    : std::integral_constant<std::size_t, sizeof...(ts)> {};

template <typename list_t>
inline constexpr std::size_t type_list_size_v = type_list_size<list_t>::value;

template <std::size_t index, typename list_t> struct type_list_at;

template <std::size_t index, typename head_t, typename... tail_t>
struct type_list_at<index, type_list<head_t, tail_t...>>
    : type_list_at<index - 1U, type_list<tail_t...>> {};

template <typename head_t, typename... tail_t>
struct type_list_at<0U, type_list<head_t, tail_t...>> {
  using type = head_t;
};

template <std::size_t index, typename list_t>
using type_list_at_t = typename type_list_at<index, list_t>::type;

template <typename t> struct function_traits;

template <typename return_t, typename... args_t>
struct function_traits<return_t(args_t...)> {
  using argument_types = type_list<args_t...>;
};

template <typename return_t, typename... args_t>
struct function_traits<return_t (*)(args_t...)>
    : function_traits<return_t(args_t...)> {};

template <typename class_t, typename return_t, typename... args_t>
struct function_traits<return_t (class_t::*)(args_t...)>
    : function_traits<return_t(args_t...)> {};

template <typename class_t, typename return_t, typename... args_t>
struct function_traits<return_t (class_t::*)(args_t...) const>
    : function_traits<return_t(args_t...)> {};

template <typename callable_t>
  requires requires { &remove_cvref_t<callable_t>::operator(); }
struct function_traits<callable_t>
    : function_traits<decltype(&remove_cvref_t<callable_t>::operator())> {};

template <typename t>
using function_argument_types_t =
    typename function_traits<remove_cvref_t<t>>::argument_types;

template <typename t> struct default_instance_factory {
  [[nodiscard]] static auto make() -> remove_cvref_t<t>
    requires default_initializable_object<t>
  {
    return remove_cvref_t<t>{};
  }
};

template <typename t> struct default_instance_factory<std::shared_ptr<t>> {
  [[nodiscard]] static auto make() -> std::shared_ptr<t> {
    using pointee_t = std::remove_cv_t<t>;
    return std::make_shared<pointee_t>(
        default_instance_factory<pointee_t>::make());
  }
};

template <typename t> struct default_instance_factory<std::optional<t>> {
  [[nodiscard]] static auto make() -> std::optional<t> { return std::nullopt; }
};

template <typename t>
[[nodiscard]] auto default_instance() -> remove_cvref_t<t> {
  return default_instance_factory<remove_cvref_t<t>>::make();
}

} // namespace vg::core
