#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>

#include <sqljudge/liveness.h>
#include <sqljudge/dispatcher.h>

extern std::string kListenHost;
extern int kListenPort;

// Serve the intake API over HTTP. Returns only if the listener fails.
bool ServerWorkLoop(Dispatcher&, const LivenessMonitor&);

#endif  // SERVER_IO_H_
