#pragma once

#include <exception>
#include <functional>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace airwaiter {

/**
 * Set of exception kinds which are ignored when thrown by a waiter action.
 *
 * Each entry is a matcher over the thrown exception. Ignore<E>() matches E and
 * everything derived from it; IgnoreIf() accepts any caller-defined matcher.
 */
class ExceptionFilter {
 public:
    using Matcher = std::function<bool(const std::exception_ptr&)>;

    ExceptionFilter() = default;

    /**
     * Ignore exceptions of type E (or derived from E).
     *
     * @return the filter
     */
    template <typename E>
    ExceptionFilter& Ignore() {
        return IgnoreIf(typeid(E).name(), [](const std::exception_ptr& error) {
            try {
                std::rethrow_exception(error);
            } catch (const E&) {
                return true;
            } catch (...) {
                return false;
            }
        });
    }

    /**
     * Ignore exceptions accepted by the matcher.
     *
     * @param name a label used in logs
     * @param matcher returns true for exceptions to ignore
     * @return the filter
     */
    ExceptionFilter& IgnoreIf(std::string name, Matcher matcher);

    /**
     * @return true if the exception belongs to the ignored set
     */
    [[nodiscard]] bool Matches(const std::exception_ptr& error) const;

    [[nodiscard]] bool Empty() const { return entries_.empty(); }

    [[nodiscard]] size_t Size() const { return entries_.size(); }

    [[nodiscard]] std::vector<std::string> GetNames() const;

 private:
    struct Entry {
        std::string name;
        Matcher matcher;
    };

    std::vector<Entry> entries_;
};

/**
 * @return the what() of a std::exception, or a placeholder for anything else
 */
std::string DescribeException(const std::exception_ptr& error);

} // namespace airwaiter
