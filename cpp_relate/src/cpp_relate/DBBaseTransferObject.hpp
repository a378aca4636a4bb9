#ifndef BASE_TRANSFER_OBJECT_HPP
#define BASE_TRANSFER_OBJECT_HPP

#include <cstdint>

namespace cpp_relate
{

/*!
 * \brief Base of every typed record struct
 *
 * Derive from this and register the struct with BOOST_DESCRIBE_STRUCT,
 * listing cpp_relate::BaseTransferObject as its base, to map it onto an
 * entity kind (see DBTransferObject.hpp).
 */
struct BaseTransferObject
{
  //! The identity assigned by the store. 0 until inserted.
  uint32_t id{0};
};

}  // namespace cpp_relate

#endif  // BASE_TRANSFER_OBJECT_HPP
