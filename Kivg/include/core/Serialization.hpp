#ifndef KIVG_SERIALIZATION_HPP
#define KIVG_SERIALIZATION_HPP
#include "core.h"

#include <nlohmann/json.hpp>

/**
 * @brief Finds the enum value whose name matches the string exactly.
 * @return The enum value, or nullopt when no name matches
*/
template<typename EnumType, size_t NumEnums>
std::optional<EnumType> findMatchingEnum(const std::array<const char*, NumEnums>& enumNames, const std::string& str)
{
	for (size_t i = 0; i < NumEnums; i++)
	{
		if (str == enumNames[i])
		{
			return (EnumType)i;
		}
	}

	return std::nullopt;
}

template<typename T>
[[nodiscard]]
inline T readJsonValue(const nlohmann::json& j, const char* propertyName, const T& defaultValue)
{
	if (j.contains(propertyName) && !j[propertyName].is_null())
	{
		return j[propertyName].get<T>();
	}

	return defaultValue;
}

/**
 * @brief Reads an enum stored by name. A missing property yields the default,
 *        a present but unknown name yields nullopt.
*/
template<typename EnumType, size_t NumEnums>
[[nodiscard]]
inline std::optional<EnumType> readJsonEnum(const nlohmann::json& j, const char* propertyName, const std::array<const char*, NumEnums>& enumNames, EnumType defaultValue)
{
	if (!j.contains(propertyName) || j[propertyName].is_null())
	{
		return defaultValue;
	}

	if (!j[propertyName].is_string())
	{
		return std::nullopt;
	}

	return findMatchingEnum<EnumType, NumEnums>(enumNames, j[propertyName].get<std::string>());
}

// ------------------- Serialization helpers -------------------
#define SERIALIZE_NON_NULL_PROP(j, obj, prop) \
  j[#prop] = (obj)->prop

#define SERIALIZE_PROP_AS(j, obj, prop, propertyName) \
  j[propertyName] = (obj)->prop

#define SERIALIZE_VALUE_INLINE(j, prop, value) \
  j[#prop] = value

#define SERIALIZE_ENUM_AS(j, obj, prop, propertyName, enumNamesArray) \
  j[propertyName] = enumNamesArray[(size_t)(obj)->prop]

#define SERIALIZE_SIMPLE_ARRAY(j, obj, prop) \
do { \
  j[#prop] = nlohmann::json::array(); \
  for (const auto& _data : (obj)->prop) { \
  	  j[#prop].emplace_back(_data); \
  } \
} while(false)

// ------ My Vector Types ------
#define SERIALIZE_VEC_AS(j, obj, prop, propertyName) \
  CMath::serialize(j, propertyName, (obj)->prop)

// ------------------- Deserialization helpers -------------------
#define DESERIALIZE_PROP_AS(obj, prop, j, propertyName, defaultValue) \
  (obj)->prop = readJsonValue<decltype((obj)->prop)>(j, propertyName, defaultValue)

#define DESERIALIZE_VALUE_INLINE(j, prop, defaultValue) \
  readJsonValue(j, #prop, defaultValue)

// ------ My Vector types ------
#define DESERIALIZE_VEC4_AS(obj, prop, j, propertyName, defaultValue) \
  (obj)->prop = CMath::deserializeVec4(j.contains(propertyName) ? j[propertyName] : nlohmann::json(), defaultValue)

#endif
