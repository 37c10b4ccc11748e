#pragma once
#include "prism_con/transport/transport_interface.hpp"

namespace prism {

class NullTransport : public ITransport {
public:
    void write(const std::string&) override {}
};

} // namespace prism
