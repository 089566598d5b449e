#ifndef LIVEPROP_PROPERTY_VALUE_H
#define LIVEPROP_PROPERTY_VALUE_H

#include <liveprop/liveprop_export.h>
#include <liveprop/util/errors.h>

#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <typeinfo>

namespace liveprop {
    /*
     * PropertyValue uses the same type erasure layout as a classic concept / model pair:
     * i.   PropertyValue is the handle the engine passes around,
     * ii.  PropertyTypeConcept carries the behaviour the engine needs as virtual methods,
     * iii. PropertyTypeModel<T> delegates each behaviour to the held T (through property_traits<T>).
     *
     * The engine only needs copy, strict equality and a printable form for tracing, so that is all the
     * concept exposes. An empty handle is the "unset" value, returned for properties that were never set.
     */
    using lp_int = int64_t;
    using lp_float = double;
    using lp_string = std::string;

    class PropertyValue;

    /**
     * Customisation point for the behaviour of a held type. Specialise this for types that do not have a
     * usable operator== or fmt formatter (the python module does this for nb::object).
     */
    template<typename T>
    struct property_traits {
        static bool equal(const T &lhs, const T &rhs) { return lhs == rhs; }

        static std::string to_string(const T &value) {
            if constexpr (fmt::is_formattable<T>::value) {
                return fmt::format("{}", value);
            } else {
                return fmt::format("<{}>", typeid(T).name());
            }
        }
    };

    namespace detail {
        struct PropertyTypeConcept {
            using u_ptr = std::unique_ptr<PropertyTypeConcept>;

            virtual ~PropertyTypeConcept() = default;

            [[nodiscard]] virtual bool operator==(const PropertyValue &other) const = 0;

            [[nodiscard]] virtual u_ptr clone() const = 0;

            [[nodiscard]] virtual const std::type_info &type() const = 0;

            [[nodiscard]] virtual std::string to_string() const = 0;
        };

        template<typename T>
        struct PropertyTypeModel : PropertyTypeConcept {
            explicit PropertyTypeModel(T value) : object{std::move(value)} {
            }

            [[nodiscard]] bool operator==(const PropertyValue &other) const override;

            [[nodiscard]] PropertyTypeConcept::u_ptr clone() const override {
                return std::make_unique<PropertyTypeModel>(*this);
            }

            [[nodiscard]] const std::type_info &type() const final { return typeid(T); }

            [[nodiscard]] std::string to_string() const final { return property_traits<T>::to_string(object); }

            T object;
        };
    } // namespace detail

    /**
     * The value held by a stored property, or returned by the getter of a computed property.
     *
     * Equality is strict: values are equal only when they hold the same type and the held objects are equal.
     * Two unset values are equal, an unset value is never equal to a set one.
     */
    class LIVEPROP_EXPORT PropertyValue {
        std::unique_ptr<detail::PropertyTypeConcept> _pimpl;

    public:
        PropertyValue() = default;

        explicit PropertyValue(std::unique_ptr<detail::PropertyTypeConcept> value) : _pimpl{std::move(value)} {
        }

        PropertyValue(const PropertyValue &);

        PropertyValue(PropertyValue &&) noexcept = default;

        PropertyValue &operator=(const PropertyValue &);

        PropertyValue &operator=(PropertyValue &&) noexcept = default;

        [[nodiscard]] bool operator==(const PropertyValue &other) const;

        template<typename T>
        friend struct detail::PropertyTypeModel;

        template<typename T>
        [[nodiscard]] const T &as() const {
            auto mdl{dynamic_cast<const detail::PropertyTypeModel<T> *>(_pimpl.get())};
            if (mdl) return mdl->object;
            throw bad_property_type(typeid(T).name(), type_name());
        }

        template<typename T>
        [[nodiscard]] bool is() const {
            return dynamic_cast<const detail::PropertyTypeModel<T> *>(_pimpl.get()) != nullptr;
        }

        [[nodiscard]] bool is_un_set() const { return !(bool) _pimpl; }

        [[nodiscard]] std::string type_name() const;

        [[nodiscard]] std::string to_string() const;
    };

    /**
     * Create a property value from a raw value.
     *
     * Integral values are widened to lp_int, floating point values to lp_float and anything viewable as a
     * string is held as lp_string, so that 1 and 1L, or "a" and std::string("a"), are the same property value.
     */
    template<typename T>
        requires std::copy_constructible<T>
    PropertyValue make_property_value(T value) {
        if constexpr (std::integral<T> && !std::same_as<T, bool>) {
            return PropertyValue(std::make_unique<detail::PropertyTypeModel<lp_int> >(static_cast<lp_int>(value)));
        } else if constexpr (std::floating_point<T>) {
            return PropertyValue(std::make_unique<detail::PropertyTypeModel<lp_float> >(static_cast<lp_float>(value)));
        } else if constexpr (std::convertible_to<T, std::string_view>) {
            return PropertyValue(std::make_unique<detail::PropertyTypeModel<lp_string> >(
                lp_string{std::string_view{value}}));
        } else {
            return PropertyValue(std::make_unique<detail::PropertyTypeModel<T> >(std::move(value)));
        }
    }

    namespace detail {
        template<typename T>
        bool PropertyTypeModel<T>::operator==(const PropertyValue &other) const {
            auto other_model{dynamic_cast<const PropertyTypeModel<T> *>(other._pimpl.get())};
            return other_model && property_traits<T>::equal(object, other_model->object);
        }
    } // namespace detail
} // namespace liveprop

namespace fmt {
    template<>
    struct formatter<liveprop::PropertyValue> : formatter<string_view> {
        // parse is inherited from formatter<string_view>.
        template<typename FormatContext>
        auto format(const liveprop::PropertyValue &c, FormatContext &ctx) const {
            return formatter<string_view>::format(c.to_string(), ctx);
        }
    };
} // namespace fmt

#endif  // LIVEPROP_PROPERTY_VALUE_H
