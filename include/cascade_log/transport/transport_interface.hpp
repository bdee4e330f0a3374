#ifndef CASCADE_LOG_TRANSPORT_INTERFACE_HPP
#define CASCADE_LOG_TRANSPORT_INTERFACE_HPP

#include <string>

namespace cascade {

    class ITransport {
    public:
        virtual ~ITransport() = default;

        /// Write one fully rendered record. The text already carries its
        /// line terminator.
        virtual void write(const std::string& rendered) = 0;
    };

} // namespace cascade

#endif // CASCADE_LOG_TRANSPORT_INTERFACE_HPP
