/**
 * @file mongo_instance.cpp
 * @brief Process-wide MongoDB driver instance
 */

#include "mongo/mongo_instance.h"

namespace mongokit::mongo {

mongocxx::instance& GetMongoInstance() {
  static mongocxx::instance instance{};
  return instance;
}

}  // namespace mongokit::mongo
