#ifndef __PCI_ERROR_H__
#define __PCI_ERROR_H__

#include <stdexcept>
#include <string>

// resource missing, permission denied or I/O failure while reading a device
class read_error : public std::runtime_error
{
public:
    read_error(const std::string& address, const std::string& attribute, const std::string& message)
        : std::runtime_error(describe(address, attribute, message)),
          m_address(address),
          m_attribute(attribute)
    {
    }

    const std::string& getAddress()   const { return m_address;   }
    const std::string& getAttribute() const { return m_attribute; }

private:
    static std::string describe(const std::string& address, const std::string& attribute, const std::string& message)
    {
        std::string text;
        if (!address.empty())
            text += address + ": ";
        if (!attribute.empty())
            text += attribute + ": ";
        return text + message;
    }

    std::string m_address;
    std::string m_attribute;
};

// malformed value of a single attribute
class parse_error : public std::runtime_error
{
public:
    parse_error(const std::string& attribute, const std::string& value)
        : std::runtime_error("malformed " + attribute + " value '" + value + "'"),
          m_attribute(attribute),
          m_value(value)
    {
    }

    const std::string& getAttribute() const { return m_attribute; }
    const std::string& getValue()     const { return m_value;     }

private:
    std::string m_attribute;
    std::string m_value;
};

// the snapshot does not form a forest
class topology_error : public std::runtime_error
{
public:
    topology_error(const std::string& address, const std::string& message)
        : std::runtime_error(address + ": " + message),
          m_address(address)
    {
    }

    const std::string& getAddress() const { return m_address; }

private:
    std::string m_address;
};

class filter_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// unreadable or malformed device validation file
class validation_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

#endif
