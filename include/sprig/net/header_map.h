#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sprig::net {

// Case-insensitive header store. Names are kept lowercase and iterate in
// sorted order, so serialized responses are byte-for-byte reproducible.
class HeaderMap {
public:
    void set(const std::string& name, const std::string& value);
    void append(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    size_t size() const { return headers_.size(); }
    bool empty() const { return headers_.empty(); }

    using iterator = std::multimap<std::string, std::string>::const_iterator;
    iterator begin() const { return headers_.begin(); }
    iterator end() const { return headers_.end(); }

private:
    std::multimap<std::string, std::string> headers_;
    static std::string normalize_name(const std::string& name);
};

} // namespace sprig::net
