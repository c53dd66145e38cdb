#include <obligation/schema/command.hpp>
#include <iterator>

namespace obligation::schema {

signer_set_t signer_set(const command_t& command) {
  return signer_set_t{std::begin(command.signers), std::end(command.signers)};
}

}  // namespace obligation::schema
