#include "io/json_reader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace relpack::io
{

    nlohmann::json loadJsonFile(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + path.string());
        }

        nlohmann::json data;
        in >> data;
        if (!data.is_object())
        {
            throw std::runtime_error("JSON root is not object: " + path.string());
        }
        return data;
    }

    std::vector<std::string> splitFlags(const std::string &text)
    {
        std::vector<std::string> out;
        std::istringstream input(text);
        std::string token;
        while (input >> token)
        {
            out.push_back(token);
        }
        return out;
    }

    std::vector<std::string> readArgList(const nlohmann::json &node)
    {
        if (node.is_string())
        {
            return splitFlags(node.get<std::string>());
        }

        std::vector<std::string> out;
        if (!node.is_array())
        {
            return out;
        }
        for (const auto &item : node)
        {
            if (!item.is_string())
            {
                throw std::runtime_error("argument list holds a non-string value: " + item.dump());
            }
            out.push_back(item.get<std::string>());
        }
        return out;
    }

} // namespace relpack::io
