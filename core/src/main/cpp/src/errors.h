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

#include <stdexcept>
#include <string>

namespace dfstate {

    /**
     * Root of the store's structural error taxonomy. Miss is not an error and
     * never travels through this hierarchy.
     */
    class StateError : public std::runtime_error {
    public:
        explicit StateError(const std::string& what) : std::runtime_error(what) {}
    };

    // Unique-index duplicate on insert, or removal of a row that is not present.
    // Signals an upstream consistency bug; never retried.
    class ConstraintViolation : public StateError {
    public:
        explicit ConstraintViolation(const std::string& what) : StateError(what) {}
    };

    // Durable medium failure. Fatal for the node that raised it.
    class StorageIOError : public StateError {
    public:
        StorageIOError(const std::string& what, const std::string& path, int err)
            : StateError(what + " [" + path + "]: " + describe(err)),
              path_(path), err_(err) {}

        const std::string& path() const noexcept { return path_; }
        int error_code() const noexcept { return err_; }

    private:
        static std::string describe(int err);

        std::string path_;
        int err_;
    };

    // Checkpoint and data disagree on open. Requires operator intervention.
    class RecoveryInconsistency : public StateError {
    public:
        RecoveryInconsistency(const std::string& what, const std::string& path)
            : StateError(what + " [" + path + "]"), path_(path) {}

        const std::string& path() const noexcept { return path_; }

    private:
        std::string path_;
    };

} // namespace dfstate
