// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "Config.hxx"
#include "io/Logger.hxx"
#include "io/MakeDirectory.hxx"
#include "net/SocketDescriptor.hxx"

#include <chrono>

#include <fcntl.h> // for AT_FDCWD

static UniqueFileDescriptor
OpenOrCreateDirectory(const std::filesystem::path &path)
{
	return MakeNestedDirectory(FileDescriptor{AT_FDCWD}, path.c_str());
}

Instance::Instance(const Config &_config)
	:config(_config),
	 shutdown_listener(event_loop, BIND_THIS_METHOD(OnShutdown)),
	 video_directory(OpenOrCreateDirectory(config.video_directory)),
	 chunk_directory(OpenOrCreateDirectory(config.chunk_directory)),
	 default_headers(MakeDefaultHeaders(config)),
	 chunk_receiver(event_loop, registry, config.upload, chunk_directory),
	 finalizer(event_loop, registry, chunk_directory, video_directory),
	 direct_uploader(event_loop, config.upload, video_directory),
	 pruner(event_loop, registry, chunk_directory,
		config.upload.session_timeout),
	 handler(config, video_directory, chunk_receiver, finalizer,
		 direct_uploader),
	 listener(event_loop, *this)
{
}

Instance::~Instance() noexcept
{
	connections.clear_and_dispose([](HttpServerConnection *c){
		delete c;
	});
}

void
Instance::Run()
{
	const unsigned n_stale =
		pruner.DeleteStaleDirectories(std::chrono::system_clock::now());
	if (n_stale > 0)
		LogFmt(2, "upload", "deleted {} stale chunk directories", n_stale);

	listener.ListenTCP(config.listen_port);
	LogFmt(2, "listener", "listening on port {}", listener.GetLocalPort());

	shutdown_listener.Enable();
	pruner.Start();

	event_loop.Run();
}

void
Instance::OnShutdown() noexcept
{
	shutdown_listener.Disable();
	pruner.Stop();
	event_loop.Break();
}

void
Instance::OnNewConnection(UniqueSocketDescriptor &&socket) noexcept
{
	auto *connection = new HttpServerConnection(event_loop,
						    std::move(socket),
						    *this, handler,
						    default_headers);
	connections.push_back(*connection);
	connection->Start();
}

void
Instance::OnHttpConnectionClosed(HttpServerConnection &connection) noexcept
{
	/* auto-unlinks from #connections */
	delete &connection;
}
