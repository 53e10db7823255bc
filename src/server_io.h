#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>
#include <execbox/service.h>

extern std::string kListenHost;
extern int kListenPort;
extern size_t kServerThreads;

// Serve the HTTP interface until StopServer is called; returns false if the socket cannot be bound.
bool ServerWorkLoop(ExecutionService&);
// Safe to call from another thread
void StopServer();

#endif  // SERVER_IO_H_
