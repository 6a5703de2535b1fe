#ifndef DOCINTEL_MODEL_INTERFACE_HPP
#define DOCINTEL_MODEL_INTERFACE_HPP

#include <nlohmann/json.hpp>

namespace docintel
{

/**
 * @brief Common interface of the JSON request/response models
 */
class IModel
{
public:
    virtual ~IModel() = default;

    // Checks field values after from_json or manual population
    virtual bool validate() const = 0;

    virtual nlohmann::json to_json() const = 0;

    // Throws std::runtime_error on missing or mistyped required fields
    virtual void from_json(const nlohmann::json &j) = 0;
};

} // namespace docintel

#endif // DOCINTEL_MODEL_INTERFACE_HPP
