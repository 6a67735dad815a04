/*
 *  This file is part of nzbstream.
 *
 *  Copyright (C) 2007-2019 Andrey Prygunkov <hugbug@users.sourceforge.net>
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#include "nzbstream.h"

#include <catch2/catch.hpp>

#include "ServerPool.h"

class IdleSession : public NewsSession
{
public:
	using NewsSession::NewsSession;
	virtual EStatus Body(Segment* segment, CancelToken* cancel, CharBuffer& data) { return nsFailed; }
};

static void AddTestServer(ServerPool* pool, int id, bool active, int level, bool optional, int group, int connections)
{
	pool->AddServer(std::make_unique<NewsServer>(id, active, BString<20>("server%i", id), "/var/spool/news",
		connections, level, group, optional));
}

static void InitTestSessions(ServerPool* pool)
{
	pool->InitSessions([](NewsServer* newsServer)
		{
			return std::unique_ptr<NewsSession>(new IdleSession(newsServer));
		});
}

TEST_CASE("Server pool: simple levels", "[ServerPool][Quick]")
{
	ServerPool pool;
	AddTestServer(&pool, 1, true, 2, false, 0, 2);
	InitTestSessions(&pool);
	REQUIRE(pool.GetMaxNormLevel() == 0);
	REQUIRE(pool.GetLevelCount() == 1);

	AddTestServer(&pool, 2, true, 10, false, 0, 3);
	InitTestSessions(&pool);
	REQUIRE(pool.GetMaxNormLevel() == 1);
	REQUIRE(pool.GetFreeSessions(0) == 2);
	REQUIRE(pool.GetFreeSessions(1) == 3);

	NewsSession* ses1 = pool.GetSession(0, nullptr, nullptr);
	NewsSession* ses2 = pool.GetSession(0, nullptr, nullptr);
	NewsSession* ses3 = pool.GetSession(0, nullptr, nullptr);
	REQUIRE(ses1 != nullptr);
	REQUIRE(ses2 != nullptr);
	REQUIRE(ses1 != ses2);
	REQUIRE(ses3 == nullptr);
	REQUIRE(pool.GetFreeSessions(0) == 0);

	pool.FreeSession(ses1);
	REQUIRE(pool.GetFreeSessions(0) == 1);
	ses3 = pool.GetSession(0, nullptr, nullptr);
	REQUIRE(ses3 != nullptr);

	ses1 = pool.GetSession(1, nullptr, nullptr);
	ses2 = pool.GetSession(1, nullptr, nullptr);
	ses3 = pool.GetSession(1, nullptr, nullptr);
	NewsSession* ses4 = pool.GetSession(1, nullptr, nullptr);
	REQUIRE(ses1 != nullptr);
	REQUIRE(ses2 != nullptr);
	REQUIRE(ses3 != nullptr);
	REQUIRE(ses4 == nullptr);
	REQUIRE(ses1->GetNewsServer()->GetLevel() == 10);
}

TEST_CASE("Server pool: want server", "[ServerPool][Quick]")
{
	ServerPool pool;
	AddTestServer(&pool, 1, true, 0, false, 0, 2);
	AddTestServer(&pool, 2, true, 0, false, 0, 1);
	AddTestServer(&pool, 3, true, 1, false, 0, 3);
	InitTestSessions(&pool);

	NewsServer* serv1 = pool.GetServers()->at(0).get();
	NewsServer* serv2 = pool.GetServers()->at(1).get();

	NewsSession* ses1 = pool.GetSession(0, serv1, nullptr);
	NewsSession* ses2 = pool.GetSession(0, serv1, nullptr);
	NewsSession* ses3 = pool.GetSession(0, serv1, nullptr);
	REQUIRE(ses1 != nullptr);
	REQUIRE(ses2 != nullptr);
	REQUIRE(ses3 == nullptr);
	REQUIRE(ses1->GetNewsServer() == serv1);
	REQUIRE(ses2->GetNewsServer() == serv1);

	NewsSession* ses4 = pool.GetSession(0, nullptr, nullptr);
	REQUIRE(ses4 != nullptr);
	REQUIRE(ses4->GetNewsServer() == serv2);
}

TEST_CASE("Server pool: inactive servers", "[ServerPool][Quick]")
{
	ServerPool pool;
	AddTestServer(&pool, 1, false, 0, false, 0, 2);
	AddTestServer(&pool, 2, true, 0, false, 0, 1);
	AddTestServer(&pool, 3, false, 1, false, 0, 1);
	InitTestSessions(&pool);

	// an inactive backup server does not create a level
	REQUIRE(pool.GetMaxNormLevel() == 0);
	REQUIRE(pool.GetServers()->at(2)->GetNormLevel() == -1);

	NewsSession* ses1 = pool.GetSession(0, nullptr, nullptr);
	NewsSession* ses2 = pool.GetSession(0, nullptr, nullptr);
	REQUIRE(ses1 != nullptr);
	REQUIRE(ses1->GetNewsServer()->GetId() == 2);
	REQUIRE(ses2 == nullptr);
}

TEST_CASE("Server pool: ignore servers", "[ServerPool][Quick]")
{
	int group = 0;
	SECTION("ungrouped") { group = 0; }
	SECTION("grouped") { group = 1; }

	ServerPool pool;
	AddTestServer(&pool, 1, true, 0, false, group, 2);
	AddTestServer(&pool, 2, true, 0, false, group, 2);
	InitTestSessions(&pool);

	NewsServer* serv1 = pool.GetServers()->at(0).get();
	ServerPool::RawServerList ignoreServers;
	ignoreServers.push_back(serv1);

	NewsSession* ses1 = pool.GetSession(0, nullptr, &ignoreServers);
	NewsSession* ses2 = pool.GetSession(0, nullptr, &ignoreServers);
	NewsSession* ses3 = pool.GetSession(0, nullptr, &ignoreServers);

	if (group == 0)
	{
		REQUIRE(ses1 != nullptr);
		REQUIRE(ses2 != nullptr);
		REQUIRE(ses1->GetNewsServer()->GetId() == 2);
		REQUIRE(ses3 == nullptr);
	}
	else
	{
		// a failed server excludes the whole group
		REQUIRE(ses1 == nullptr);
		REQUIRE(ses2 == nullptr);
		REQUIRE(ses3 == nullptr);
	}
}

TEST_CASE("Server pool: block servers", "[ServerPool][Quick]")
{
	ServerPool pool;
	AddTestServer(&pool, 1, true, 0, false, 0, 2);
	AddTestServer(&pool, 2, true, 0, false, 0, 2);
	AddTestServer(&pool, 3, true, 1, false, 0, 2);
	InitTestSessions(&pool);
	pool.SetRetryInterval(60);

	NewsServer* serv1 = pool.GetServers()->at(0).get();
	pool.BlockServer(serv1);
	REQUIRE(pool.IsServerBlocked(serv1));

	NewsSession* ses1 = pool.GetSession(0, nullptr, nullptr);
	NewsSession* ses2 = pool.GetSession(0, nullptr, nullptr);
	NewsSession* ses3 = pool.GetSession(0, nullptr, nullptr);
	REQUIRE(ses1 != nullptr);
	REQUIRE(ses2 != nullptr);
	REQUIRE(ses3 == nullptr);
	CHECK(ses1->GetNewsServer()->GetId() == 2);
	CHECK(ses2->GetNewsServer()->GetId() == 2);

	pool.FreeSession(ses1);
	pool.FreeSession(ses2);

	NewsServer* serv2 = pool.GetServers()->at(1).get();
	pool.BlockServer(serv2);

	// blocked non-optional servers are waited for instead of using the backup level
	REQUIRE(pool.GetSession(0, nullptr, nullptr) == nullptr);
}

TEST_CASE("Server pool: block optional servers", "[ServerPool][Quick]")
{
	ServerPool pool;
	AddTestServer(&pool, 1, true, 0, true, 0, 2);
	AddTestServer(&pool, 2, true, 0, true, 0, 2);
	AddTestServer(&pool, 3, true, 1, false, 0, 2);
	InitTestSessions(&pool);
	pool.SetRetryInterval(60);

	pool.BlockServer(pool.GetServers()->at(0).get());
	pool.BlockServer(pool.GetServers()->at(1).get());

	NewsSession* ses1 = pool.GetSession(0, nullptr, nullptr);
	NewsSession* ses2 = pool.GetSession(0, nullptr, nullptr);
	NewsSession* ses3 = pool.GetSession(0, nullptr, nullptr);

	// all servers on level 0 are optional and blocked, the level-1 server is used
	REQUIRE(ses1 != nullptr);
	REQUIRE(ses2 != nullptr);
	REQUIRE(ses3 == nullptr);
	CHECK(ses1->GetNewsServer()->GetLevel() == 1);
	CHECK(ses2->GetNewsServer()->GetLevel() == 1);
}

TEST_CASE("Server pool: retry interval disabled", "[ServerPool][Quick]")
{
	ServerPool pool;
	AddTestServer(&pool, 1, true, 0, false, 0, 1);
	InitTestSessions(&pool);

	NewsServer* serv1 = pool.GetServers()->at(0).get();
	pool.BlockServer(serv1);
	REQUIRE_FALSE(pool.IsServerBlocked(serv1));
	REQUIRE(pool.GetSession(0, nullptr, nullptr) != nullptr);
}
