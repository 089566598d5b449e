#pragma once

#include <liveprop/runtime/observers/property_observer.h>

#include <memory>
#include <optional>
#include <string>

namespace liveprop {

    /**
     * @brief Logs out the sets and change notifications of the objects it observes.
     *
     * This is voluminous but can be helpful tracing down unexpected propagation. Each line is prefixed with
     * the label of the object and indented by the depth of the notification cascade.
     */
    class LIVEPROP_EXPORT PropertyTrace : public PropertyObserver {
    public:
        /**
         * @brief Construct a new Property Trace object
         *
         * @param filter Used to restrict which properties to report (substring match on the property name)
         * @param set Log set related events
         * @param notify Log change notification events
         */
        explicit PropertyTrace(const std::optional<std::string> &filter = std::nullopt,
                               bool set = true, bool notify = true);

        /**
         * @brief A trace configured from the environment, or nullptr when tracing is not requested.
         *
         * LIVEPROP_TRACE - when set a trace is created, a non-empty value is used as the filter.
         * LIVEPROP_TRACE_VALUES - when set, values are printed as well.
         */
        [[nodiscard]] static std::shared_ptr<PropertyTrace> from_environment();

        void on_before_set(LiveObject &object, const std::string &name, const PropertyValue &value) override;
        void on_after_set(LiveObject &object, const std::string &name, bool changed) override;
        void on_read_only_write(LiveObject &object, const std::string &name) override;
        void on_before_change_notification(LiveObject &object, const std::string &name) override;
        void on_after_change_notification(LiveObject &object, const std::string &name) override;

        // Static configuration
        static void set_print_values(bool value);
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _set;
        bool _notify;
        int _depth{0};

        static bool _print_values;
        static bool _use_logger;

        void _print(const LiveObject &object, const std::string &msg) const;
        [[nodiscard]] bool _should_log(const std::string &name) const;
    };

} // namespace liveprop
