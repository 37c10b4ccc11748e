#ifndef PRISM_CON_WRITE_RECORD_HPP
#define PRISM_CON_WRITE_RECORD_HPP

#include <string>
#include <utility>

namespace prism {

    /// One Output Sink write, built under the console lock and consumed
    /// exactly once by the drain loop.
    struct WriteRecord {
        bool fileOnly;
        std::string raw;        ///< written to the log verbatim
        std::string formatted;  ///< written to the device
        bool shouldPrint;       ///< user-mode gate, evaluated at write time

        WriteRecord() : fileOnly(false), shouldPrint(true) {}
        WriteRecord(bool fileOnlyFlag, std::string rawText, std::string formattedText, bool print)
            : fileOnly(fileOnlyFlag)
            , raw(std::move(rawText))
            , formatted(std::move(formattedText))
            , shouldPrint(print) {}
    };

    /// One queued Error Sink item: a block header or a caller's fragment.
    struct ErrorFragment {
        std::string raw;
        std::string formatted;
        bool visible;

        ErrorFragment() : visible(true) {}
        ErrorFragment(std::string rawText, std::string formattedText, bool isVisible)
            : raw(std::move(rawText))
            , formatted(std::move(formattedText))
            , visible(isVisible) {}
    };

} // namespace prism

#endif // PRISM_CON_WRITE_RECORD_HPP
