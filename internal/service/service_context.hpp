#pragma once

#include <memory>

namespace payday::command { class CommandHandler; }
namespace payday::eventstore { class EventStore; }

namespace payday::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<payday::command::CommandHandler> handler;
  std::shared_ptr<payday::eventstore::EventStore> events;
};

}
