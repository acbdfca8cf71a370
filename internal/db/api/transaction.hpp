#pragma once

namespace ledgersync::db {

/*
  One unit of work against the local ledger.

  Every backend guarantees:

  - writes stay invisible to other transactions until Commit()
  - Rollback(), or destruction without Commit(), discards every write
  - one transaction at a time per repository; Begin() waits for the
    previous one, so never nest Begin() on one thread

  EntityStore opens exactly one per Run()/Read() call.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
