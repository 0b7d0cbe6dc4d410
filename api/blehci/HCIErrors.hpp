/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef HCI_ERRORS_HPP_
#define HCI_ERRORS_HPP_

#include <string>
#include <cstdint>
#include <system_error>

namespace blehci {

    /** \addtogroup BLEHCISystemAPI
     *
     *  @{
     */

    /**
     * Classified failures of the HCI socket and device ioctl path.
     * <p>
     * OS errors without a dedicated value are passed through
     * in std::system_category() with their original `errno`, e.g. `ENODEV` for an unknown adapter.
     * </p>
     */
    enum class HCISocketError : int {
        SUCCESS           = 0,
        /** EPERM or EACCES, i.e. missing CAP_NET_ADMIN or CAP_NET_RAW */
        PERMISSION_DENIED = 1,
        NOT_CONNECTED     = 3,
        /** EBUSY, e.g. HCIChannel::USER on an adapter being up */
        BUSY              = 4,
        IO                = 5
    };
    constexpr int number(const HCISocketError rhs) noexcept {
        return static_cast<int>(rhs);
    }
    std::string to_string(const HCISocketError v) noexcept;

    class HCISocketErrorCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "HCISocket"; }
            std::string message(int condition) const override {
                return "HCISocket::"+to_string( static_cast<HCISocketError>(condition) );
            }
            static HCISocketErrorCategory& get() {
                static HCISocketErrorCategory s;
                return s;
            }
    };
    inline std::error_code make_error_code( HCISocketError e ) noexcept {
        return std::error_code( number(e), HCISocketErrorCategory::get() );
    }

    /**
     * Maps the result of an OS call to an error code, reading `errno` for a negative `res`.
     * <p>
     * EPERM and EACCES map to HCISocketError::PERMISSION_DENIED,
     * EBUSY to HCISocketError::BUSY and any other `errno` to std::system_category().
     * </p>
     * @param res the OS call result
     * @param ec cleared if `res >= 0`, otherwise set to the classified error
     * @return `res` unchanged
     */
    int classify_os_result(const int res, std::error_code& ec) noexcept;

    /** As classify_os_result(int, std::error_code&), using the explicit `errno_value`. */
    std::error_code classify_errno(const int errno_value) noexcept;

    /**@}*/

} // namespace blehci

// injecting specialization of std::is_error_code_enum
namespace std {
    template <>
        struct is_error_code_enum<blehci::HCISocketError> : true_type {};
}

#endif /* HCI_ERRORS_HPP_ */
