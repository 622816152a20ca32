#include "airwaiter/exception_filter.h"

#include <stdexcept>

namespace airwaiter {

ExceptionFilter& ExceptionFilter::IgnoreIf(std::string name, Matcher matcher) {
    if (!matcher) {
        throw std::invalid_argument("Exception matcher must not be empty");
    }
    entries_.push_back(Entry{std::move(name), std::move(matcher)});
    return *this;
}

bool ExceptionFilter::Matches(const std::exception_ptr& error) const {
    if (error == nullptr) {
        return false;
    }
    for (const auto& entry : entries_) {
        if (entry.matcher(error)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ExceptionFilter::GetNames() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    return names;
}

std::string DescribeException(const std::exception_ptr& error) {
    if (error == nullptr) {
        return "no exception";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace airwaiter
