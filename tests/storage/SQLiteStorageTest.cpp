#include <QtTest/QtTest>

#include <memory>

#include "Errors.hpp"
#include "SQLiteStorage.hpp"

class SQLiteStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void initializeIsIdempotent();
    void createSetsEqualTimestamps();
    void createKeepsExplicitFields();
    void listOrdersByIdDescending();
    void replaceRefreshesUpdatedAtOnly();
    void setCompletedTouchesOnlyFlagAndUpdatedAt();
    void missingIdLeavesStoreUnchanged();
    void deleteIsPermanentAndIdsAreNotReused();
    void schemaRejectsEmptyTitle();
    void titleWithNulCharacterRoundTrips();
    void clockSteppingBackwardsKeepsUpdatedAtOrdered();
    void unreachableDatabaseThrows();

private:
    void advance(int seconds) { m_now = m_now.addSecs(seconds); }

    std::unique_ptr<QTemporaryDir> m_dir;
    QDateTime m_now;
    std::unique_ptr<SQLiteStorage> m_storage;
};

void SQLiteStorageTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());

    m_now = QDateTime(QDate(2024, 1, 15), QTime(10, 30, 0, 250), QTimeZone::UTC);
    m_storage = std::make_unique<SQLiteStorage>(m_dir->filePath("todo.db"),
                                                [this] { return m_now; });
    QVERIFY(m_storage->initialize());
}

void SQLiteStorageTest::cleanup()
{
    m_storage.reset();
    m_dir.reset();
}

void SQLiteStorageTest::initializeIsIdempotent()
{
    m_storage->addTask(TaskCreate{QStringLiteral("keep me"), std::nullopt, false});
    QVERIFY(m_storage->initialize());
    QCOMPARE(m_storage->getAllTasks().size(), std::size_t(1));
}

void SQLiteStorageTest::createSetsEqualTimestamps()
{
    const Task task = m_storage->addTask(TaskCreate{QStringLiteral("Buy milk"), std::nullopt, false});

    QCOMPARE(task.id, qint64(1));
    QCOMPARE(task.title, QStringLiteral("Buy milk"));
    QVERIFY(!task.description.has_value());
    QCOMPARE(task.completed, false);
    QCOMPARE(task.createdAt, QStringLiteral("2024-01-15T10:30:00+00:00"));
    QCOMPARE(task.updatedAt, task.createdAt);

    const QJsonObject json = task.toJson();
    QVERIFY(json.value("description").isNull());
    QCOMPARE(json.value("id").toInteger(), qint64(1));
}

void SQLiteStorageTest::createKeepsExplicitFields()
{
    const Task task = m_storage->addTask(
        TaskCreate{QStringLiteral("Call mom"), QString(), true});

    QVERIFY(task.description.has_value());
    QCOMPARE(*task.description, QString());
    QCOMPARE(task.completed, true);

    const auto fetched = m_storage->getTaskById(task.id);
    QVERIFY(fetched.has_value());
    QVERIFY(fetched->description.has_value());
    QCOMPARE(fetched->completed, true);
}

void SQLiteStorageTest::listOrdersByIdDescending()
{
    for (const char *title : {"first", "second", "third"}) {
        m_storage->addTask(TaskCreate{QString::fromLatin1(title), std::nullopt, false});
        advance(1);
    }

    // Touching the oldest row must not move it up.
    QVERIFY(m_storage->replaceTask(1, TaskUpdate{QStringLiteral("first!"), std::nullopt, true}));

    const auto tasks = m_storage->getAllTasks();
    QCOMPARE(tasks.size(), std::size_t(3));
    QCOMPARE(tasks[0].id, qint64(3));
    QCOMPARE(tasks[1].id, qint64(2));
    QCOMPARE(tasks[2].id, qint64(1));
    QCOMPARE(tasks[2].title, QStringLiteral("first!"));
}

void SQLiteStorageTest::replaceRefreshesUpdatedAtOnly()
{
    const Task created = m_storage->addTask(
        TaskCreate{QStringLiteral("Draft"), QStringLiteral("notes"), false});
    advance(5);

    const auto replaced = m_storage->replaceTask(
        created.id, TaskUpdate{QStringLiteral("Final"), std::nullopt, true});
    QVERIFY(replaced.has_value());

    QCOMPARE(replaced->id, created.id);
    QCOMPARE(replaced->title, QStringLiteral("Final"));
    QVERIFY(!replaced->description.has_value());
    QCOMPARE(replaced->completed, true);
    QCOMPARE(replaced->createdAt, created.createdAt);
    QCOMPARE(replaced->updatedAt, QStringLiteral("2024-01-15T10:30:05+00:00"));
    QVERIFY(replaced->updatedAt > replaced->createdAt);
}

void SQLiteStorageTest::setCompletedTouchesOnlyFlagAndUpdatedAt()
{
    const Task created = m_storage->addTask(
        TaskCreate{QStringLiteral("Buy milk"), QStringLiteral("2 liters"), false});
    advance(2);

    const auto updated = m_storage->setTaskCompleted(created.id, true);
    QVERIFY(updated.has_value());
    QCOMPARE(updated->completed, true);
    QCOMPARE(updated->title, created.title);
    QCOMPARE(updated->description.value_or(QString()), QStringLiteral("2 liters"));
    QCOMPARE(updated->createdAt, created.createdAt);
    QVERIFY(updated->updatedAt > created.updatedAt);

    advance(1);
    const auto reverted = m_storage->setTaskCompleted(created.id, false);
    QVERIFY(reverted.has_value());
    QCOMPARE(reverted->completed, false);
    QVERIFY(reverted->updatedAt > updated->updatedAt);
}

void SQLiteStorageTest::missingIdLeavesStoreUnchanged()
{
    const Task created = m_storage->addTask(TaskCreate{QStringLiteral("only"), std::nullopt, false});
    advance(10);

    QVERIFY(!m_storage->replaceTask(999, TaskUpdate{QStringLiteral("x"), std::nullopt, true}));
    QVERIFY(!m_storage->setTaskCompleted(999, true));
    QVERIFY(!m_storage->deleteTask(999));
    QVERIFY(!m_storage->getTaskById(999));

    const auto tasks = m_storage->getAllTasks();
    QCOMPARE(tasks.size(), std::size_t(1));
    QCOMPARE(tasks.front().title, created.title);
    QCOMPARE(tasks.front().updatedAt, created.updatedAt);
    QCOMPARE(tasks.front().completed, false);
}

void SQLiteStorageTest::deleteIsPermanentAndIdsAreNotReused()
{
    m_storage->addTask(TaskCreate{QStringLiteral("one"), std::nullopt, false});
    const Task second = m_storage->addTask(TaskCreate{QStringLiteral("two"), std::nullopt, false});

    QVERIFY(m_storage->deleteTask(second.id));
    QVERIFY(!m_storage->getTaskById(second.id));
    QVERIFY(!m_storage->deleteTask(second.id));

    const Task third = m_storage->addTask(TaskCreate{QStringLiteral("three"), std::nullopt, false});
    QCOMPARE(third.id, qint64(3));

    const auto tasks = m_storage->getAllTasks();
    QCOMPARE(tasks.size(), std::size_t(2));
    QCOMPARE(tasks[0].id, qint64(3));
    QCOMPARE(tasks[1].id, qint64(1));
}

void SQLiteStorageTest::schemaRejectsEmptyTitle()
{
    QVERIFY_THROWS_EXCEPTION(
        StorageError,
        m_storage->addTask(TaskCreate{QString(), std::nullopt, false}));

    QVERIFY(m_storage->getAllTasks().empty());

    // The failed insert was rolled back, so the next id is still 1.
    const Task task = m_storage->addTask(TaskCreate{QString(200, 'x'), std::nullopt, false});
    QCOMPARE(task.id, qint64(1));
}

void SQLiteStorageTest::titleWithNulCharacterRoundTrips()
{
    const QString title = QString(QChar(0)) + QStringLiteral("abc");
    const QString description = QStringLiteral("a") + QChar(0) + QStringLiteral("b");

    const Task task = m_storage->addTask(TaskCreate{title, description, false});
    QCOMPARE(task.title.size(), qsizetype(4));
    QCOMPARE(task.title, title);

    const auto fetched = m_storage->getTaskById(task.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->title, title);
    QCOMPARE(fetched->description.value_or(QString()), description);
}

void SQLiteStorageTest::clockSteppingBackwardsKeepsUpdatedAtOrdered()
{
    const Task created = m_storage->addTask(TaskCreate{QStringLiteral("skew"), std::nullopt, false});
    advance(-3600);

    const auto updated = m_storage->setTaskCompleted(created.id, true);
    QVERIFY(updated.has_value());
    QCOMPARE(updated->updatedAt, created.createdAt);
}

void SQLiteStorageTest::unreachableDatabaseThrows()
{
    SQLiteStorage broken(m_dir->filePath("missing/dir/todo.db"));
    QVERIFY(!broken.initialize());
    QVERIFY_THROWS_EXCEPTION(StorageError, broken.getAllTasks());
}

QTEST_GUILESS_MAIN(SQLiteStorageTest)
#include "SQLiteStorageTest.moc"
