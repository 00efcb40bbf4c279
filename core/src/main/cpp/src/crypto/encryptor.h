/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <future>
#include <string>

namespace keep {

    /**
     * Field-level encryption hook used by secure keys.
     *
     * Plaintext and ciphertext are both strings; ciphertext must survive a
     * JSON/string round trip. Failures throw KeepException(Encryption).
     * The asynchronous variants default to running the synchronous ones
     * on the calling thread.
     */
    class Encryptor {
    public:
        virtual ~Encryptor() = default;

        virtual void init() {}

        virtual std::string encrypt_sync(const std::string& plaintext) const = 0;
        virtual std::string decrypt_sync(const std::string& ciphertext) const = 0;

        virtual std::future<std::string> encrypt(const std::string& plaintext) const {
            return ready(plaintext, true);
        }

        virtual std::future<std::string> decrypt(const std::string& ciphertext) const {
            return ready(ciphertext, false);
        }

    private:
        std::future<std::string> ready(const std::string& input, bool encrypting) const {
            std::promise<std::string> p;
            try {
                p.set_value(encrypting ? encrypt_sync(input) : decrypt_sync(input));
            } catch (...) {
                p.set_exception(std::current_exception());
            }
            return p.get_future();
        }
    };

} // namespace keep
