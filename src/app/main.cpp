// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QLoggingCategory>

#include <QtWidgets/QApplication>
#include <QtWidgets/QLabel>
#include <QtWidgets/QMainWindow>
#include <QtWidgets/QVBoxLayout>

#include <cstdlib>

#include "sheet/SheetConfig.hpp"
#include "sheet/widgets/BottomSheetWidget.hpp"

Q_LOGGING_CATEGORY(demolog, "sheet.demo")

static void printErrorsAndFail(const QString& header, const QStringList& errors)
{
	qCritical().noquote() << header;
	for (const QString& e : errors)
		qCritical().noquote() << "  " << e;
}

static QWidget* makeMapPlaceholder()
{
	auto* map = new QLabel(QStringLiteral("Map"));
	map->setObjectName("MapPlaceholder");
	map->setAlignment(Qt::AlignHCenter | Qt::AlignTop);
	map->setMargin(24);
	map->setStyleSheet(QStringLiteral("QLabel#MapPlaceholder { background: #cfe3d4; color: #4a5a50; }"));
	return map;
}

int main(int argc, char** argv)
{
	QApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("sheetdemo"));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Bottom sheet over a map view."));
	parser.addHelpOption();
	const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
	                                      QStringLiteral("Read sheet configuration from <file> (JSON)."),
	                                      QStringLiteral("file"));
	parser.addOption(configOption);
	parser.process(app);

	Sheet::SheetConfig config;
	if (parser.isSet(configOption)) {
		const Utils::Result loaded = Sheet::SheetConfig::loadFile(parser.value(configOption), config);
		if (!loaded) {
			printErrorsAndFail("Failed to load sheet configuration.", loaded.errors);
			return EXIT_FAILURE;
		}
	}

	QMainWindow window;
	window.resize(420, 760);

	QWidget* map = makeMapPlaceholder();
	window.setCentralWidget(map);

	Sheet::BottomSheetWidget* sheet = nullptr;
	try {
		sheet = new Sheet::BottomSheetWidget(config, map);
	} catch (const Sheet::ConfigError& e) {
		printErrorsAndFail("Invalid sheet configuration.", e.errors());
		return EXIT_FAILURE;
	}

	auto* header = new QLabel(QStringLiteral("Nearby stops"));
	header->setMargin(8);
	sheet->setHeader(header);

	auto* list = new QWidget;
	auto* listLayout = new QVBoxLayout(list);
	for (int i = 1; i <= 30; ++i)
		listLayout->addWidget(new QLabel(QStringLiteral("Stop %1").arg(i)));
	listLayout->addStretch(1);
	sheet->setContent(list);

	// Keep the visible map area above the sheet, the way a map view would pad
	// its viewport.
	auto padMap = [map](double h) {
		if (auto* label = qobject_cast<QLabel*>(map))
			label->setText(QStringLiteral("Map (bottom padding %1 px)").arg(qRound(h)));
	};
	QObject::connect(sheet, &Sheet::BottomSheetWidget::heightChanged, map, padMap);
	padMap(sheet->sheetHeight());
	QObject::connect(sheet, &Sheet::BottomSheetWidget::closeRequested, &app, []() {
		qCInfo(demolog) << "sheet close requested";
	});

	window.show();
	sheet->show();

	return app.exec();
}
