#pragma once

#include <string>
#include <core/config.hpp>
#include <core/types.hpp>

// Build the ProxyCommand used to tunnel through `proxy`:
//
//   ssh -q [-A] -o UserKnownHostsFile=/dev/null -o StrictHostKeyChecking=no
//       -o KeepAlive=yes -o ServerAliveInterval=60 [-i key]... [-p port]
//       user@host nc %h %p
//
// The relay leaves %h/%p for the caller to fill in with the final target.
// Fails with ErrorKind::Config when the proxy user, then the proxy host, is
// missing. host_key_verify keeps the local known_hosts checks enabled.
Result<std::string> build_proxy_command(const ProxyConfig& proxy,
                                        bool forward_agent = true,
                                        bool host_key_verify = false);

// Interactive console command for `config`, with a ProxyCommand clause when a
// proxy host is configured.
Result<std::string> build_console_command(const ConnectionConfig& config);

// Substitute %h, %p and %% in a ProxyCommand.
std::string expand_proxy_command(const std::string& command,
                                 const std::string& host, int port);
