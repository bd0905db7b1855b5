/*
 * Copyright (C) 2026, Robert Patterson
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace fontcat {

/// thrown when a family, variant or property is looked up by a key that does not exist
class not_found : public std::out_of_range
{
public:
    explicit not_found(const std::string& msg) : std::out_of_range(msg) {}
};

/// thrown when an integer position is outside [0, size)
class index_out_of_range : public std::out_of_range
{
public:
    index_out_of_range(std::size_t index, std::size_t size) :
        std::out_of_range("index " + std::to_string(index) + " is out of range (size " + std::to_string(size) + ")"),
        m_index(index),
        m_size(size) {}

    std::size_t index() const { return m_index; }
    std::size_t size() const { return m_size; }

private:
    std::size_t m_index;
    std::size_t m_size;
};

/// thrown for malformed query filters
class invalid_argument : public std::invalid_argument
{
public:
    explicit invalid_argument(const std::string& msg) : std::invalid_argument(msg) {}
};

/// thrown when a filter value cannot be converted to a property's string representation
class type_mismatch : public std::invalid_argument
{
public:
    explicit type_mismatch(const std::string& typeName) :
        std::invalid_argument("'" + typeName + "' object cannot be converted to 'string'"),
        m_typeName(typeName) {}

    const std::string& typeName() const { return m_typeName; }

private:
    std::string m_typeName;
};

} // namespace fontcat
